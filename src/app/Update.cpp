#include "app/Update.hpp"
#include "runtime/Context.hpp"
#include "remote/Factory.hpp"
#include "remote/Store.hpp"
#include "state/Lock.hpp"
#include "state/Store.hpp"
#include "sync/Reconciler.hpp"
#include "sync/Workspace.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace mds::app {

static fs::path resolveDirectory(const fs::path& dir) {
    const auto target = dir.empty() ? fs::current_path() : dir;
    std::error_code ec;
    if (!fs::is_directory(target, ec))
        throw SetupError(fmt::format("{} does not exist or is not a directory", target.string()));
    return fs::canonical(target);
}

UpdateResult update(const runtime::Context& ctx, const fs::path& dir) {
    const auto local = resolveDirectory(dir);
    const auto stateStore = state::Store::forDirectory(local, ctx.config.sync.state_filename);

    if (!stateStore.exists())
        throw NotInitializedError(fmt::format("{} is not initialized for sync; run 'mdsync init' first", local.string()));

    const state::Lock lock(state::Lock::pathFor(stateStore.path()));

    UpdateResult result;
    result.config = stateStore.load();

    if (result.config.local_path != local) {
        log::Registry::mdsync()->warn("[Update] Config recorded {} but lives in {}; using {}",
                                      result.config.local_path.string(), local.string(), local.string());
        result.config.local_path = local;
    }

    const auto store = ctx.remotes->open(result.config.remote);
    {
        const sync::Workspace scratch;
        result.report = sync::Reconciler(ctx, store).run(result.config, scratch.path());
    }

    // an interrupted run keeps the records it finished but is not a completed sync
    if (!result.report.interrupted) result.config.last_sync = ctx.clock();
    stateStore.save(result.config);

    log::Registry::mdsync()->info("[Update] {} synced: {}", local.string(), result.report.summary());
    return result;
}

state::SyncConfig status(const runtime::Context& ctx, const fs::path& dir) {
    const auto local = resolveDirectory(dir);
    return state::Store::forDirectory(local, ctx.config.sync.state_filename).load();
}

}
