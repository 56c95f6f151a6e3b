#pragma once

#include "state/SyncConfig.hpp"
#include "sync/model/Report.hpp"

#include <filesystem>

namespace mds::runtime { struct Context; }

namespace mds::app {

struct UpdateResult {
    state::SyncConfig config;
    sync::model::Report report;
};

// One full run: lock, load, push then pull, stamp last_sync, save atomically.
// Fatal errors propagate and leave the saved config as it was. An interrupted run saves
// the records it completed and leaves last_sync untouched.
UpdateResult update(const runtime::Context& ctx, const std::filesystem::path& dir);

// Read-only view of the persisted mapping.
state::SyncConfig status(const runtime::Context& ctx, const std::filesystem::path& dir);

}
