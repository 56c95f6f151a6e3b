#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace mds::config {

static void parseInto(const fs::path& path, Config& cfg);

Config loadConfig(const fs::path& path) {
    Config cfg;
    if (!path.empty() && fs::exists(path)) parseInto(path, cfg);

    if (cfg.sync.workers == 0) cfg.sync.workers = 1;
    if (cfg.sync.local_extension.empty() || cfg.sync.remote_extension.empty())
        throw ConfigError("sync.local_extension and sync.remote_extension must not be empty");
    if (cfg.sync.local_extension == cfg.sync.remote_extension)
        throw ConfigError("sync.local_extension and sync.remote_extension must differ");

    cfg.logging.log_dir = util::expandHome(cfg.logging.log_dir);
    cfg.remote.drive.token_file = util::expandHome(cfg.remote.drive.token_file);

    return cfg;
}

static void parseInto(const fs::path& path, Config& cfg) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse config file " + path.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) return;
    if (!root.IsMap()) throw ConfigError("Config file " + path.string() + " must be a YAML mapping");

    try {
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
        if (auto node = root["converter"]) YAML::convert<ConverterConfig>::decode(node, cfg.converter);
        if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
        if (auto node = root["sync"]) YAML::convert<ReconcileConfig>::decode(node, cfg.sync);
        if (auto node = root["git"]) YAML::convert<GitConfig>::decode(node, cfg.git);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value in config file " + path.string() + ": " + e.what());
    }
}

fs::path resolveConfigPath(const std::optional<fs::path>& override) {
    if (override && !override->empty()) return util::expandHome(*override);
    if (const char* env = std::getenv("MDSYNC_CONFIG"); env && *env) return util::expandHome(env);
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return fs::path(xdg) / "mdsync" / "config.yaml";
    return util::expandHome("~/.config/mdsync/config.yaml");
}

}
