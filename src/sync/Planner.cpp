#include "sync/Planner.hpp"
#include "state/SyncConfig.hpp"
#include "log/Registry.hpp"

#include <unordered_map>
#include <utility>

using namespace mds::sync;
using namespace mds::sync::model;
using namespace mds::state;
using mds::remote::RemoteDocument;

static std::string replaceSuffix(const std::string& name, const std::string& from, const std::string& to) {
    if (name.size() > from.size() && name.ends_with(from))
        return name.substr(0, name.size() - from.size()) + to;
    return name + to;
}

std::string Planner::localNameFor(const std::string& remoteName, const std::string& localExtension, const std::string& remoteExtension) {
    return replaceSuffix(remoteName, remoteExtension, localExtension);
}

std::string Planner::remoteNameFor(const std::string& localName, const std::string& localExtension, const std::string& remoteExtension) {
    return replaceSuffix(localName, localExtension, remoteExtension);
}

bool Planner::needsPush(const LocalDocument& local, const SyncRecord* record) {
    if (!record || !record->hasBaseline()) return true;
    return local.modified > *record->last_upload;
}

bool Planner::needsPull(const RemoteDocument& remote, const SyncRecord* record) {
    if (!record || !record->hasBaseline()) return true;
    return remote.modified > *record->last_upload;
}

std::vector<Action> Planner::planPush(const std::vector<LocalDocument>& local, const SyncConfig& config) {
    std::vector<Action> plan;
    plan.reserve(local.size());

    for (const auto& doc : local) {
        if (!needsPush(doc, config.find(doc.name))) continue;
        plan.push_back({ActionType::Push, doc.name, doc, std::nullopt});
    }

    return plan;
}

PullPlan Planner::planPull(const std::vector<RemoteDocument>& remote,
                           const SyncConfig& config,
                           const std::string& localExtension,
                           const std::string& remoteExtension) {
    PullPlan plan;

    // Same name twice in the remote collection: the newest copy stands for it.
    std::vector<std::pair<std::string, RemoteDocument>> newest;
    std::unordered_map<std::string, std::size_t> byKey;

    for (const auto& doc : remote) {
        auto key = localNameFor(doc.name, localExtension, remoteExtension);

        if (key.find('/') != std::string::npos || key.starts_with(".")) {
            log::Registry::sync()->warn("[Planner] Skipping remote document '{}': no valid local name", doc.name);
            ++plan.skipped;
            continue;
        }

        if (const auto it = byKey.find(key); it != byKey.end()) {
            log::Registry::sync()->warn("[Planner] Remote holds more than one '{}'; using the newest", doc.name);
            auto& kept = newest[it->second].second;
            if (doc.modified > kept.modified) kept = doc;
            ++plan.folded;
            continue;
        }

        byKey.emplace(key, newest.size());
        newest.emplace_back(std::move(key), doc);
    }

    for (auto& [key, doc] : newest) {
        if (!needsPull(doc, config.find(key))) {
            ++plan.unchanged;
            continue;
        }
        plan.actions.push_back({ActionType::Pull, std::move(key), std::nullopt, std::move(doc)});
    }

    return plan;
}
