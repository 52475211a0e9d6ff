#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace dw::config;

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["user"] = rhs.user;
        node["remote_root"] = rhs.remote_root;
        node["tls"] = rhs.tls;
        node["passive"] = rhs.passive;
        node["verify_peer"] = rhs.verify_peer;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("");
        rhs.port = node["port"].as<uint16_t>(21);
        rhs.user = node["user"].as<std::string>("anonymous");
        rhs.password = node["password"].as<std::string>("");
        rhs.remote_root = node["remote_root"].as<std::string>("/");
        rhs.tls = node["tls"].as<bool>(true);
        rhs.passive = node["passive"].as<bool>(true);
        rhs.verify_peer = node["verify_peer"].as<bool>(true);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(120);
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(20);
        return true;
    }
};

template<>
struct convert<DeployConfig> {
    static Node encode(const DeployConfig& rhs) {
        Node node;
        node["backup_dir"] = rhs.backup_dir.string();
        node["project"] = rhs.project;
        return node;
    }

    static bool decode(const Node& node, DeployConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backup_dir = node["backup_dir"].as<std::string>("backups");
        rhs.project = node["project"].as<std::string>("");
        return true;
    }
};

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["deploywarden"] = to_std_string(spdlog::level::to_string_view(rhs.deploywarden));
        node["sync"]         = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["remote"]       = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["vcs"]          = to_std_string(spdlog::level::to_string_view(rhs.vcs));
        node["record"]       = to_std_string(spdlog::level::to_string_view(rhs.record));
        node["crypto"]       = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["shell"]        = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.deploywarden = levelOr(node["deploywarden"], def.deploywarden);
        rhs.sync         = levelOr(node["sync"], def.sync);
        rhs.remote       = levelOr(node["remote"], def.remote);
        rhs.vcs          = levelOr(node["vcs"], def.vcs);
        rhs.record       = levelOr(node["record"], def.record);
        rhs.crypto       = levelOr(node["crypto"], def.crypto);
        rhs.shell        = levelOr(node["shell"], def.shell);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig def;
        rhs.console_log_level = levelOr(node["console_log_level"], def.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], def.file_log_level);
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
