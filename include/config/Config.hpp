#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace mds::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mdsync  = spdlog::level::info;   // Startup, command results
    spdlog::level::level_enum sync    = spdlog::level::info;   // Per-document push/pull decisions
    spdlog::level::level_enum convert = spdlog::level::warn;   // Converter failures and timeouts
    spdlog::level::level_enum remote  = spdlog::level::warn;   // HTTP/transport errors
    spdlog::level::level_enum state   = spdlog::level::warn;   // Config load/save problems
    spdlog::level::level_enum shell   = spdlog::level::warn;   // Argument parsing edge cases
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{}; // empty: console only
    LogLevelsConfig levels;
};

struct ConverterConfig {
    std::string binary = "pandoc";
    std::chrono::seconds timeout{120};
    std::string local_format = "markdown";
    std::string remote_format = "docx";
};

struct DriveConfig {
    std::string api_base = "https://www.googleapis.com/drive/v3";
    std::string upload_base = "https://www.googleapis.com/upload/drive/v3";
    std::filesystem::path token_file = "~/.mdsync/token.json";
};

struct RemoteConfig {
    std::chrono::seconds timeout{300};
    std::chrono::seconds connect_timeout{30};
    DriveConfig drive;
};

struct ReconcileConfig {
    unsigned int workers = 1;
    std::string local_extension = ".md";
    std::string remote_extension = ".docx";
    std::string state_filename = ".mdsync_config.json";
};

struct GitConfig {
    std::string binary = "git";
    std::chrono::seconds timeout{30};
};

struct Config {
    LoggingConfig logging;
    ConverterConfig converter;
    RemoteConfig remote;
    ReconcileConfig sync;
    GitConfig git;
};

// A missing file yields defaults; a malformed one throws ConfigError.
Config loadConfig(const std::filesystem::path& path);

// --config, then $MDSYNC_CONFIG, then $XDG_CONFIG_HOME/mdsync/config.yaml, then ~/.config/mdsync/config.yaml
std::filesystem::path resolveConfigPath(const std::optional<std::filesystem::path>& override = std::nullopt);

}
