#pragma once

#include "sync/model/Report.hpp"

#include <filesystem>
#include <memory>

namespace mds::runtime { struct Context; }
namespace mds::remote { class Store; }
namespace mds::state { struct SyncConfig; }

namespace mds::sync {

// Last-write-wins reconciliation between the local directory and the remote collection.
// The push phase completes before the remote is listed for the pull phase.
class Reconciler {
public:
    Reconciler(const runtime::Context& ctx, std::shared_ptr<remote::Store> store);

    // Mutates config.files for every document synchronized; throws on fatal errors.
    model::Report run(state::SyncConfig& config, const std::filesystem::path& scratch) const;

private:
    const runtime::Context& ctx_;
    std::shared_ptr<remote::Store> store_;
};

}
