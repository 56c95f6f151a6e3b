#include "sync/Workspace.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace mds::sync;
namespace fs = std::filesystem;

Workspace::Workspace(const fs::path& parent) {
    for (int attempt = 0; attempt < 8; ++attempt) {
        auto candidate = parent / fmt::format("mdsync-{}", util::generate_random_suffix(12));
        std::error_code ec;
        if (fs::create_directory(candidate, ec)) {
            path_ = std::move(candidate);
            log::Registry::sync()->debug("[Workspace] Created {}", path_.string());
            return;
        }
        if (ec) throw SetupError(fmt::format("Cannot create scratch directory in {}: {}", parent.string(), ec.message()));
    }
    throw SetupError(fmt::format("Cannot create a unique scratch directory in {}", parent.string()));
}

Workspace::~Workspace() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) log::Registry::sync()->warn("[Workspace] Failed to remove {}: {}", path_.string(), ec.message());
}
