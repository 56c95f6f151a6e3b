#include "app/Init.hpp"
#include "runtime/Context.hpp"
#include "remote/Factory.hpp"
#include "state/Lock.hpp"
#include "state/Store.hpp"
#include "util/errors.hpp"
#include "util/process.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace mds::app {

static void initGitRepository(const runtime::Context& ctx, const fs::path& dir, InitResult& result) {
    std::error_code ec;
    if (fs::exists(dir / ".git", ec)) {
        result.git_message = "git repository already present";
        return;
    }

    const auto& git = ctx.config.git;
    try {
        const auto res = util::process::run({git.binary, "init"}, std::chrono::duration_cast<std::chrono::milliseconds>(git.timeout), dir);
        if (res.ok()) {
            result.git_initialized = true;
            return;
        }
        result.git_message = fmt::format("git init exited with {}: {}", res.exit_code, res.output);
    } catch (const ProcessError& e) {
        result.git_message = e.what();
    }

    log::Registry::mdsync()->warn("[Init] Skipping git repository in {}: {}", dir.string(), result.git_message);
}

InitResult initialize(const runtime::Context& ctx, const InitOptions& opts) {
    std::error_code ec;
    if (opts.local_path.empty() || !fs::is_directory(opts.local_path, ec))
        throw SetupError(fmt::format("Local folder {} does not exist or is not a directory", opts.local_path.string()));

    const auto local = fs::canonical(opts.local_path);
    const auto stateStore = state::Store::forDirectory(local, ctx.config.sync.state_filename);

    if (stateStore.exists() && !opts.force)
        throw SetupError(fmt::format("{} is already initialized; pass --force to overwrite {}",
                                     local.string(), stateStore.path().filename().string()));

    const state::Lock lock(state::Lock::pathFor(stateStore.path()));

    InitResult result;
    result.config_path = stateStore.path();
    result.config.local_path = local;
    result.config.remote = ctx.remotes->resolve(opts.backend, opts.remote);

    stateStore.save(result.config);
    log::Registry::mdsync()->info("[Init] Tracking {} against {}", local.string(), remote::to_string(result.config.remote));

    if (opts.init_git) initGitRepository(ctx, local, result);

    return result;
}

}
