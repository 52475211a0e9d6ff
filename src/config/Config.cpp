#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace dw::config {

Config loadConfig(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    if (!fs::exists(path)) throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
    }

    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping: " + path.string());

    if (auto node = root["remote"]) {
        RemoteConfig remote;
        if (!YAML::convert<RemoteConfig>::decode(node, remote))
            throw std::runtime_error("Config section 'remote' must be a mapping");
        cfg.remote = remote;
    } else if (root["host"]) {
        // flat legacy layout: {"host", "port", "user", "password", "remote_root"}
        RemoteConfig remote;
        YAML::convert<RemoteConfig>::decode(root, remote);
        cfg.remote = remote;
    }

    if (auto node = root["deploy"]) YAML::convert<DeployConfig>::decode(node, cfg.deploy);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.remote && cfg.remote->host.empty())
        throw std::runtime_error("Config section 'remote' is missing 'host'");

    const auto base = fs::absolute(path).parent_path();
    if (cfg.deploy.backup_dir.is_relative()) cfg.deploy.backup_dir = base / cfg.deploy.backup_dir;
    if (!cfg.logging.log_dir.empty() && cfg.logging.log_dir.is_relative()) cfg.logging.log_dir = base / cfg.logging.log_dir;

    return cfg;
}

std::filesystem::path defaultLogDir() {
    if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state)
        return std::filesystem::path(state) / "deploywarden";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".local" / "state" / "deploywarden";
    return std::filesystem::temp_directory_path() / "deploywarden";
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    if (cfg.remote) root["remote"] = *cfg.remote;
    root["deploy"] = cfg.deploy;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str()) + "\n";
}

void to_json(nlohmann::json& j, const RemoteConfig& c) {
    // password is never serialized
    j = {
        {"host", c.host},
        {"port", c.port},
        {"user", c.user},
        {"remote_root", c.remote_root},
        {"tls", c.tls},
        {"passive", c.passive},
        {"verify_peer", c.verify_peer},
        {"timeout_seconds", c.timeout_seconds},
        {"connect_timeout_seconds", c.connect_timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const DeployConfig& c) {
    j = {
        {"backup_dir", c.backup_dir.string()},
        {"project", c.project}
    };
}

} // namespace dw::config
