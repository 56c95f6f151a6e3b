#pragma once

#include "sync/model/Action.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mds::state {
struct SyncConfig;
struct SyncRecord;
}

namespace mds::sync {

// Every listed remote document lands in exactly one bucket.
struct PullPlan {
    std::vector<model::Action> actions;
    std::size_t unchanged = 0;
    std::size_t skipped = 0;   // no usable local name
    std::size_t folded = 0;    // older copies of a name listed more than once
};

// Pure last-write-wins staleness decisions. Nothing here touches the filesystem.
struct Planner {
    // Stale when there is no baseline or the local mtime is strictly newer than it.
    [[nodiscard]] static bool needsPush(const model::LocalDocument& local, const state::SyncRecord* record);

    // Stale when there is no baseline or the remote mtime is strictly newer than it.
    [[nodiscard]] static bool needsPull(const remote::RemoteDocument& remote, const state::SyncRecord* record);

    static std::vector<model::Action> planPush(const std::vector<model::LocalDocument>& local,
                                               const state::SyncConfig& config);

    static PullPlan planPull(const std::vector<remote::RemoteDocument>& remote,
                                               const state::SyncConfig& config,
                                               const std::string& localExtension,
                                               const std::string& remoteExtension);

    // "report.docx" -> "report.md"; a name without the remote extension keeps its stem and gains the local one.
    [[nodiscard]] static std::string localNameFor(const std::string& remoteName,
                                                  const std::string& localExtension,
                                                  const std::string& remoteExtension);

    [[nodiscard]] static std::string remoteNameFor(const std::string& localName,
                                                   const std::string& localExtension,
                                                   const std::string& remoteExtension);
};

}
