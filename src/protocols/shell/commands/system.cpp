#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/usage/SystemUsage.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

#include <fmt/core.h>

#ifndef MDS_VERSION
#define MDS_VERSION "0.0.0"
#endif

namespace mds::shell {

static CommandResult handle_help(const Router& router, const CommandCall& call) {
    if (call.positionals.empty()) return ok(router.book().basicStr());
    const auto* usage = router.usageFor(call.positionals.front());
    if (!usage) return invalid(router.book().basicStr(), fmt::format("help: unknown command '{}'", call.positionals.front()));
    return ok(usage->str());
}

static CommandResult handle_version(const CommandCall&) {
    return ok(fmt::format("mdsync v{}\n", MDS_VERSION));
}

void registerSystemCommands(const std::shared_ptr<Router>& r) {
    const std::weak_ptr<Router> weak = r;
    r->registerCommand(SystemUsage::help(), [weak](const CommandCall& call) {
        const auto router = weak.lock();
        if (!router) return invalid("help: router is gone");
        return handle_help(*router, call);
    });
    r->registerCommand(SystemUsage::version(), handle_version);
}

}
