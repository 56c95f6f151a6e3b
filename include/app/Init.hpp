#pragma once

#include "remote/Descriptor.hpp"
#include "state/SyncConfig.hpp"

#include <filesystem>
#include <string>

namespace mds::runtime { struct Context; }

namespace mds::app {

struct InitOptions {
    std::filesystem::path local_path;
    std::string remote;                           // Drive folder name or mount directory
    remote::Backend backend{remote::Backend::Drive};
    bool force = false;
    bool init_git = false;
};

struct InitResult {
    std::filesystem::path config_path;
    state::SyncConfig config;
    bool git_initialized = false;
    std::string git_message;                      // why git init was skipped or failed
};

// Validates both sides, writes an empty SyncConfig and optionally runs `git init`.
// Throws SetupError (and RemoteError for an unreachable Drive).
InitResult initialize(const runtime::Context& ctx, const InitOptions& opts);

}
