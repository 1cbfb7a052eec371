#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace mh::config {

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["build"]) YAML::convert<BuildConfig>::decode(node, cfg.build);
    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (auto rules = root["copy_rules"]) {
        if (!rules.IsSequence()) throw std::runtime_error("copy_rules must be a sequence in " + path.string());
        for (const auto& r : rules) {
            CopyRule rule;
            if (!YAML::convert<CopyRule>::decode(r, rule))
                throw std::runtime_error("copy_rules entry requires source_pattern and destination");
            cfg.copy_rules.push_back(std::move(rule));
        }
    }

    return cfg;
}

Config defaultConfig() {
    Config cfg;
    cfg.build.command = "zola build";
    cfg.copy_rules.push_back({"./sync/public/*", "./output", true});
    return cfg;
}

void Config::save(const std::filesystem::path& path) const {
    YAML::Node root;
    root["remote"] = remote;
    root["sync"] = sync;
    root["build"] = build;

    YAML::Node rules(YAML::NodeType::Sequence);
    for (const auto& rule : copy_rules) rules.push_back(rule);
    root["copy_rules"] = rules;

    root["server"] = server;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;

    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) throw std::runtime_error("Failed to write config file: " + path.string());
    file << out.c_str() << '\n';
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"local_base_path", c.local_base_path.string()},
        {"cursor_file", c.cursor_file},
        {"coalesce_remote_changed", c.coalesce_remote_changed}
    };
}

void to_json(nlohmann::json& j, const BuildConfig& c) {
    j = {
        {"command", c.command},
        {"working_directory", c.working_directory.string()}
    };
}

void to_json(nlohmann::json& j, const CopyRule& c) {
    j = {
        {"source_pattern", c.source_pattern},
        {"destination", c.destination.string()},
        {"recursive", c.recursive}
    };
}

// app_secret never leaves the process
void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"admin_port", c.admin_port},
        {"webhook_path", c.webhook_path},
        {"signature_verification", !c.app_secret.empty()}
    };
}

} // namespace mh::config
