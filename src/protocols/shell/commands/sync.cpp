#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Table.hpp"
#include "protocols/shell/usage/SyncUsage.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "app/Init.hpp"
#include "app/Update.hpp"
#include "remote/Descriptor.hpp"
#include "runtime/Context.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace mds::shell {

static fs::path pathArg(const CommandCall& call) {
    if (const auto p = optVal(call, std::vector<std::string>{"path", "p"}); p && !p->empty()) return *p;
    if (!call.positionals.empty()) return call.positionals.front();
    return {};
}

static CommandResult handle_init(const runtime::Context& ctx, const CommandCall& call) {
    const auto usage = SyncUsage::init();
    if (call.positionals.size() != 2)
        return invalid(usage.str(), "init: expected <local-path> and <remote>");

    app::InitOptions opts;
    opts.local_path = call.positionals[0];
    opts.remote = call.positionals[1];
    opts.force = hasFlag(call, std::vector<std::string>{"force", "f"});
    opts.init_git = hasFlag(call, "init-git");

    if (const auto b = optVal(call, std::vector<std::string>{"backend", "b"})) {
        try {
            opts.backend = remote::backendFromString(*b);
        } catch (const std::invalid_argument& e) {
            return invalid(usage.str(), fmt::format("init: {}", e.what()));
        }
    }

    try {
        const auto res = app::initialize(ctx, opts);
        std::string out = fmt::format("Initialized {}\n  remote: {}\n  config: {}\n",
                                      res.config.local_path.string(),
                                      remote::to_string(res.config.remote),
                                      res.config_path.string());
        if (opts.init_git)
            out += res.git_initialized ? "  git: initialized\n" : fmt::format("  git: skipped ({})\n", res.git_message);
        return ok(std::move(out));
    } catch (const Error& e) {
        log::Registry::mdsync()->error("[init] {}", e.what());
        return failed(fmt::format("init: {}", e.what()));
    }
}

static constexpr int INTERRUPTED_EXIT = 130;

static std::string renderOutcome(const sync::model::Outcome& o) {
    if (o.ok()) return fmt::format("  {:<7} {}\n", sync::model::to_string(o.status), o.key);
    return fmt::format("  {:<7} {} ({}): {}\n", "skipped", o.key, sync::model::to_string(o.action), o.reason);
}

static CommandResult handle_update(const runtime::Context& ctx, const CommandCall& call) {
    try {
        const auto res = app::update(ctx, pathArg(call));

        std::string out;
        if (hasFlag(call, "json")) {
            out = nlohmann::json(res.report).dump(2) + "\n";
        } else {
            for (const auto& o : res.report.outcomes) out += renderOutcome(o);
            out += fmt::format("{}: {}\n", res.config.local_path.string(), res.report.summary());
        }

        CommandResult result = ok(std::move(out));
        if (res.report.interrupted) {
            result.exit_code = INTERRUPTED_EXIT;
            result.stderr_text = "update: interrupted; unfinished documents will be synced next run";
        } else if (res.report.hasWarnings())
            result.stderr_text = fmt::format("warning: {} document(s) could not be synced and will be retried next run",
                                             res.report.failed());
        return result;
    } catch (const Error& e) {
        log::Registry::mdsync()->error("[update] {}", e.what());
        return failed(fmt::format("update: {}", e.what()));
    }
}

static CommandResult handle_status(const runtime::Context& ctx, const CommandCall& call) {
    try {
        const auto cfg = app::status(ctx, pathArg(call));

        std::string out = fmt::format("Local:     {}\nRemote:    {}\nLast sync: {}\n\n",
                                      cfg.local_path.string(),
                                      remote::to_string(cfg.remote),
                                      util::toString(cfg.last_sync));

        if (cfg.files.empty()) return ok(out + "No documents synced yet.\n");

        Table table({
            {"DOCUMENT", Align::Left, 8, 40, true, true},
            {"LAST SYNC", Align::Left, 9},
            {"LOCAL MTIME", Align::Left, 11},
            {"REMOTE", Align::Left, 6, 48, true, true}
        });
        for (const auto& [name, record] : cfg.files)
            table.add_row({name, util::toString(record.last_upload), util::toString(record.local_mtime), record.remote_location});

        return ok(out + table.render());
    } catch (const Error& e) {
        return failed(fmt::format("status: {}", e.what()));
    }
}

void registerSyncCommands(const std::shared_ptr<Router>& r, const runtime::Context& ctx) {
    r->registerCommand(SyncUsage::init(), [&ctx](const CommandCall& call) { return handle_init(ctx, call); });
    r->registerCommand(SyncUsage::update(), [&ctx](const CommandCall& call) { return handle_update(ctx, call); });
    r->registerCommand(SyncUsage::status(), [&ctx](const CommandCall& call) { return handle_status(ctx, call); });
}

}
