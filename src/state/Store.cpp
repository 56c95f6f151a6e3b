#include "state/Store.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace mds::state;
namespace fs = std::filesystem;
using json = nlohmann::json;

Store::Store(fs::path file) : file_(std::move(file)) {}

Store Store::forDirectory(const fs::path& dir, const std::string& filename) {
    return Store(dir / filename);
}

bool Store::exists() const {
    std::error_code ec;
    return fs::is_regular_file(file_, ec);
}

SyncConfig Store::load() const {
    if (!exists())
        throw NotInitializedError(fmt::format("Directory {} is not initialized for sync (no {}); run 'mdsync init' first",
                                              file_.parent_path().string(), file_.filename().string()));

    try {
        auto cfg = json::parse(util::readFileToString(file_)).get<SyncConfig>();
        log::Registry::state()->debug("[state::Store] Loaded {} with {} tracked documents", file_.string(), cfg.files.size());
        return cfg;
    } catch (const json::exception& e) {
        throw PersistenceError(fmt::format("Sync config {} is unreadable: {}", file_.string(), e.what()));
    } catch (const TimestampError& e) {
        throw PersistenceError(fmt::format("Sync config {} has a bad timestamp: {}", file_.string(), e.what()));
    } catch (const std::invalid_argument& e) {
        throw PersistenceError(fmt::format("Sync config {} is invalid: {}", file_.string(), e.what()));
    } catch (const Error& e) {
        throw PersistenceError(fmt::format("Failed to read sync config {}: {}", file_.string(), e.what()));
    }
}

void Store::save(const SyncConfig& config) const {
    try {
        const json j = config;
        util::writeFileAtomically(file_, j.dump(2) + "\n");
        log::Registry::state()->debug("[state::Store] Saved {}", file_.string());
    } catch (const std::exception& e) {
        log::Registry::state()->error("[state::Store] Failed to save {}: {}", file_.string(), e.what());
        throw PersistenceError(fmt::format("Failed to save sync config {}: {}", file_.string(), e.what()));
    }
}
