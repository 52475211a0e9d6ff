#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace dw::config {

struct RemoteConfig {
    std::string host;
    uint16_t port = 21;
    std::string user = "anonymous";
    std::string password;
    std::string remote_root = "/";
    bool tls = true;                  // explicit FTPS (AUTH TLS + protected data channel)
    bool passive = true;
    bool verify_peer = true;
    unsigned int timeout_seconds = 120;
    unsigned int connect_timeout_seconds = 20;
};

struct DeployConfig {
    std::filesystem::path backup_dir = "backups";
    std::string project;              // empty => basename of the working directory
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum deploywarden = spdlog::level::info;  // run lifecycle
    spdlog::level::level_enum sync         = spdlog::level::info;  // classification, plans, deploy steps
    spdlog::level::level_enum remote       = spdlog::level::info;  // FTP transfers and errors
    spdlog::level::level_enum vcs          = spdlog::level::warn;  // git invocations
    spdlog::level::level_enum record       = spdlog::level::warn;  // snapshot load/save, schema issues
    spdlog::level::level_enum crypto       = spdlog::level::warn;
    spdlog::level::level_enum shell        = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;    // empty => defaultLogDir()
    LogLevelsConfig levels;
};

struct Config {
    std::optional<RemoteConfig> remote;
    DeployConfig deploy;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

std::filesystem::path defaultLogDir();

// Effective configuration as YAML, password left out.
std::string dumpConfig(const Config& cfg);

void to_json(nlohmann::json& j, const RemoteConfig& c);
void to_json(nlohmann::json& j, const DeployConfig& c);

} // namespace dw::config
