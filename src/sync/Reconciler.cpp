#include "sync/Reconciler.hpp"
#include "sync/Executor.hpp"
#include "sync/Inventory.hpp"
#include "sync/Planner.hpp"
#include "sync/Session.hpp"
#include "runtime/Context.hpp"
#include "remote/Store.hpp"
#include "state/SyncConfig.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace mds::sync;
using namespace mds::sync::model;

Reconciler::Reconciler(const runtime::Context& ctx, std::shared_ptr<remote::Store> store)
    : ctx_(ctx), store_(std::move(store)) {}

Report Reconciler::run(state::SyncConfig& config, const std::filesystem::path& scratch) const {
    const auto& syncCfg = ctx_.config.sync;

    auto session = std::make_shared<Session>();
    session->converter = ctx_.converter;
    session->store = store_;
    session->localDir = config.local_path;
    session->scratch = scratch;
    session->localExtension = syncCfg.local_extension;
    session->remoteExtension = syncCfg.remote_extension;
    session->convertTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(ctx_.config.converter.timeout);
    session->clock = ctx_.clock;
    session->interrupted = ctx_.interrupted;

    const Executor executor(session, syncCfg.workers);

    Report report;
    report.begin = ctx_.clock();

    log::Registry::sync()->info("[Reconciler] Syncing {} with {}", config.local_path.string(), store_->describe());

    // push phase
    const auto local = Inventory::scanLocal(config.local_path, syncCfg.local_extension);
    const auto pushPlan = Planner::planPush(local, config);
    report.unchanged_local = local.size() - pushPlan.size();
    log::Registry::sync()->debug("[Reconciler] {} of {} local documents need a push", pushPlan.size(), local.size());

    for (auto& o : executor.run(pushPlan, config)) report.outcomes.push_back(std::move(o));

    if (session->stopRequested()) {
        report.interrupted = true;
        report.end = ctx_.clock();
        log::Registry::sync()->warn("[Reconciler] Interrupted after the push phase: {}", report.summary());
        return report;
    }

    // pull phase sees the remote as the push phase left it
    const auto remote = store_->listDocuments();
    const auto pullPlan = Planner::planPull(remote, config, syncCfg.local_extension, syncCfg.remote_extension);
    report.unchanged_remote = pullPlan.unchanged;
    report.skipped_remote = pullPlan.skipped;
    report.duplicate_remote = pullPlan.folded;
    log::Registry::sync()->debug("[Reconciler] {} of {} remote documents need a pull", pullPlan.actions.size(), remote.size());

    for (auto& o : executor.run(pullPlan.actions, config)) report.outcomes.push_back(std::move(o));

    report.interrupted = session->stopRequested();
    report.end = ctx_.clock();

    log::Registry::sync()->info("[Reconciler] {}", report.summary());
    return report;
}
