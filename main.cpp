// Config
#include "config/Config.hpp"
#include "runtime/Context.hpp"
#include "runtime/Interrupt.hpp"

// Shell
#include "protocols/shell/Router.hpp"
#include "protocols/shell/commands.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

// Misc
#include "log/Registry.hpp"
#include "util/errors.hpp"

// Libraries
#include <fmt/core.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mds;

namespace {

void printResult(const shell::CommandResult& res) {
    if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);
    if (!res.stderr_text.empty()) fmt::print(stderr, "{}\n", res.stderr_text);
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::optional<std::filesystem::path> configOverride;
    try {
        configOverride = shell::takeConfigOption(args);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "mdsync: {}\n", e.what());
        return 2;
    }

    try {
        auto cfg = config::loadConfig(config::resolveConfigPath(configOverride));
        log::Registry::init(cfg.logging);

        const auto ctx = runtime::Context::fromConfig(std::move(cfg));

        const auto router = std::make_shared<shell::Router>();
        shell::registerAllCommands(router, ctx);

        if (args.empty()) args.emplace_back("help");

        runtime::Interrupt::install();

        const auto res = router->execute(args);
        printResult(res);

        log::Registry::shutdown();
        return res.exit_code;
    } catch (const Error& e) {
        fmt::print(stderr, "mdsync: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "mdsync: unexpected error: {}\n", e.what());
        return 1;
    }
}
