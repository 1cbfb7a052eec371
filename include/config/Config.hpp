#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace mh::config {

struct RemoteConfig {
    std::string provider = "dropbox";
    std::string root = "/";
    std::string access_token;
    std::string access_token_file;
    std::string access_token_env = "MIRRORHALL_ACCESS_TOKEN";
    std::string api_url = "https://api.dropboxapi.com/2";
    std::string content_url = "https://content.dropboxapi.com/2";
    unsigned int timeout_seconds = 30;
};

struct SyncConfig {
    std::filesystem::path local_base_path = "./sync";
    std::string cursor_file = ".mirrorhall_cursor";
    bool coalesce_remote_changed = false;
    bool sync_on_startup = true;

    [[nodiscard]] std::filesystem::path cursorPath() const { return local_base_path / cursor_file; }
};

struct BuildConfig {
    std::string command;
    std::filesystem::path working_directory = "./sync";
};

struct CopyRule {
    std::string source_pattern;
    std::filesystem::path destination;
    bool recursive = false;
};

struct ServerConfig {
    bool enabled = true;
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    uint16_t admin_port = 3001;
    std::string webhook_path = "/webhook";
    std::string app_secret;  // enables X-Dropbox-Signature verification when set
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mirrorhall = spdlog::level::info;   // startup/shutdown, cycle outcomes
    spdlog::level::level_enum sync       = spdlog::level::info;
    spdlog::level::level_enum remote     = spdlog::level::warn;   // API errors, not every page
    spdlog::level::level_enum build      = spdlog::level::info;
    spdlog::level::level_enum mirror     = spdlog::level::info;
    spdlog::level::level_enum http       = spdlog::level::warn;
    spdlog::level::level_enum crypto     = spdlog::level::warn;
    spdlog::level::level_enum config     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "./logs";
    LogLevelsConfig levels;
};

struct Config {
    RemoteConfig remote;
    SyncConfig sync;
    BuildConfig build;
    std::vector<CopyRule> copy_rules;
    ServerConfig server;
    LoggingConfig logging;

    void save(const std::filesystem::path& path) const;
};

Config loadConfig(const std::filesystem::path& path);
Config defaultConfig();

void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const BuildConfig& c);
void to_json(nlohmann::json& j, const CopyRule& c);
void to_json(nlohmann::json& j, const ServerConfig& c);

} // namespace mh::config
