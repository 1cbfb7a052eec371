#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mh::config;

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["provider"] = rhs.provider;
        node["root"] = rhs.root;
        node["access_token"] = rhs.access_token;
        node["access_token_file"] = rhs.access_token_file;
        node["access_token_env"] = rhs.access_token_env;
        node["api_url"] = rhs.api_url;
        node["content_url"] = rhs.content_url;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.provider = node["provider"].as<std::string>("dropbox");
        rhs.root = node["root"].as<std::string>("/");
        rhs.access_token = node["access_token"].as<std::string>("");
        rhs.access_token_file = node["access_token_file"].as<std::string>("");
        rhs.access_token_env = node["access_token_env"].as<std::string>("MIRRORHALL_ACCESS_TOKEN");
        rhs.api_url = node["api_url"].as<std::string>("https://api.dropboxapi.com/2");
        rhs.content_url = node["content_url"].as<std::string>("https://content.dropboxapi.com/2");
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["local_base_path"] = rhs.local_base_path;
        node["cursor_file"] = rhs.cursor_file;
        node["coalesce_remote_changed"] = rhs.coalesce_remote_changed;
        node["sync_on_startup"] = rhs.sync_on_startup;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.local_base_path = node["local_base_path"].as<std::string>("./sync");
        rhs.cursor_file = node["cursor_file"].as<std::string>(".mirrorhall_cursor");
        rhs.coalesce_remote_changed = node["coalesce_remote_changed"].as<bool>(false);
        rhs.sync_on_startup = node["sync_on_startup"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<BuildConfig> {
    static Node encode(const BuildConfig& rhs) {
        Node node;
        node["command"] = rhs.command;
        node["working_directory"] = rhs.working_directory;
        return node;
    }

    static bool decode(const Node& node, BuildConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.command = node["command"].as<std::string>("");
        rhs.working_directory = node["working_directory"].as<std::string>("./sync");
        return true;
    }
};

template<>
struct convert<CopyRule> {
    static Node encode(const CopyRule& rhs) {
        Node node;
        node["source_pattern"] = rhs.source_pattern;
        node["destination"] = rhs.destination;
        node["recursive"] = rhs.recursive;
        return node;
    }

    static bool decode(const Node& node, CopyRule& rhs) {
        if (!node.IsMap()) return false;
        if (!node["source_pattern"] || !node["destination"]) return false;
        rhs.source_pattern = node["source_pattern"].as<std::string>();
        rhs.destination = node["destination"].as<std::string>();
        rhs.recursive = node["recursive"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["admin_port"] = rhs.admin_port;
        node["webhook_path"] = rhs.webhook_path;
        node["app_secret"] = rhs.app_secret;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(3000);
        rhs.admin_port = node["admin_port"].as<uint16_t>(3001);
        rhs.webhook_path = node["webhook_path"].as<std::string>("/webhook");
        rhs.app_secret = node["app_secret"].as<std::string>("");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mirrorhall"] = to_std_string(spdlog::level::to_string_view(rhs.mirrorhall));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["remote"]     = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["build"]      = to_std_string(spdlog::level::to_string_view(rhs.build));
        node["mirror"]     = to_std_string(spdlog::level::to_string_view(rhs.mirror));
        node["http"]       = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["crypto"]     = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["config"]     = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mirrorhall = spdlog::level::from_str(node["mirrorhall"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.remote = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        rhs.build = spdlog::level::from_str(node["build"].as<std::string>("info"));
        rhs.mirror = spdlog::level::from_str(node["mirror"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("./logs");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
