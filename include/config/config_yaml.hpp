#pragma once

#include "config/Config.hpp"
#include "util/errors.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mds::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto str = node.as<std::string>();
    const auto lvl = spdlog::level::from_str(str);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && str != "off")
        throw mds::ConfigError("Unknown log level '" + str + "'");
    return lvl;
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mdsync"]  = to_std_string(spdlog::level::to_string_view(rhs.mdsync));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["convert"] = to_std_string(spdlog::level::to_string_view(rhs.convert));
        node["remote"]  = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["state"]   = to_std_string(spdlog::level::to_string_view(rhs.state));
        node["shell"]   = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mdsync  = levelOr(node["mdsync"], rhs.mdsync);
        rhs.sync    = levelOr(node["sync"], rhs.sync);
        rhs.convert = levelOr(node["convert"], rhs.convert);
        rhs.remote  = levelOr(node["remote"], rhs.remote);
        rhs.state   = levelOr(node["state"], rhs.state);
        rhs.shell   = levelOr(node["shell"], rhs.shell);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.console_log_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.file_log_level));
        node["levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.levels.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        rhs.levels.console_log_level = levelOr(node["console_level"], rhs.levels.console_log_level);
        rhs.levels.file_log_level = levelOr(node["file_level"], rhs.levels.file_log_level);
        if (const auto levels = node["levels"]) convert<SubsystemLogLevelsConfig>::decode(levels, rhs.levels.subsystem_levels);
        return true;
    }
};

template<>
struct convert<ConverterConfig> {
    static Node encode(const ConverterConfig& rhs) {
        Node node;
        node["binary"] = rhs.binary;
        node["timeout_seconds"] = rhs.timeout.count();
        node["local_format"] = rhs.local_format;
        node["remote_format"] = rhs.remote_format;
        return node;
    }

    static bool decode(const Node& node, ConverterConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.binary = node["binary"].as<std::string>(rhs.binary);
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<long>(rhs.timeout.count()));
        rhs.local_format = node["local_format"].as<std::string>(rhs.local_format);
        rhs.remote_format = node["remote_format"].as<std::string>(rhs.remote_format);
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["timeout_seconds"] = rhs.timeout.count();
        node["connect_timeout_seconds"] = rhs.connect_timeout.count();
        node["drive"]["api_base"] = rhs.drive.api_base;
        node["drive"]["upload_base"] = rhs.drive.upload_base;
        node["drive"]["token_file"] = rhs.drive.token_file.string();
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<long>(rhs.timeout.count()));
        rhs.connect_timeout = std::chrono::seconds(node["connect_timeout_seconds"].as<long>(rhs.connect_timeout.count()));
        if (const auto drive = node["drive"]; drive && drive.IsMap()) {
            rhs.drive.api_base = drive["api_base"].as<std::string>(rhs.drive.api_base);
            rhs.drive.upload_base = drive["upload_base"].as<std::string>(rhs.drive.upload_base);
            rhs.drive.token_file = drive["token_file"].as<std::string>(rhs.drive.token_file.string());
        }
        return true;
    }
};

template<>
struct convert<ReconcileConfig> {
    static Node encode(const ReconcileConfig& rhs) {
        Node node;
        node["workers"] = rhs.workers;
        node["local_extension"] = rhs.local_extension;
        node["remote_extension"] = rhs.remote_extension;
        node["state_filename"] = rhs.state_filename;
        return node;
    }

    static bool decode(const Node& node, ReconcileConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.workers = node["workers"].as<unsigned int>(rhs.workers);
        rhs.local_extension = node["local_extension"].as<std::string>(rhs.local_extension);
        rhs.remote_extension = node["remote_extension"].as<std::string>(rhs.remote_extension);
        rhs.state_filename = node["state_filename"].as<std::string>(rhs.state_filename);
        return true;
    }
};

template<>
struct convert<GitConfig> {
    static Node encode(const GitConfig& rhs) {
        Node node;
        node["binary"] = rhs.binary;
        node["timeout_seconds"] = rhs.timeout.count();
        return node;
    }

    static bool decode(const Node& node, GitConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.binary = node["binary"].as<std::string>(rhs.binary);
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<long>(rhs.timeout.count()));
        return true;
    }
};

}
