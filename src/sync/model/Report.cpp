#include "sync/model/Report.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace mds::sync::model {

std::string_view to_string(const ActionType type) {
    switch (type) {
    case ActionType::Push: return "push";
    case ActionType::Pull: return "pull";
    }
    return "unknown";
}

std::string_view to_string(const Outcome::Status status) {
    switch (status) {
    case Outcome::Status::Pushed: return "pushed";
    case Outcome::Status::Pulled: return "pulled";
    case Outcome::Status::Failed: return "failed";
    }
    return "unknown";
}

static std::size_t countStatus(const std::vector<Outcome>& outcomes, const Outcome::Status status) {
    return static_cast<std::size_t>(std::ranges::count(outcomes, status, &Outcome::status));
}

std::size_t Report::pushed() const { return countStatus(outcomes, Outcome::Status::Pushed); }
std::size_t Report::pulled() const { return countStatus(outcomes, Outcome::Status::Pulled); }
std::size_t Report::failed() const { return countStatus(outcomes, Outcome::Status::Failed); }

std::string Report::summary() const {
    auto out = fmt::format("{} pushed, {} pulled, {} failed, {} unchanged",
                           pushed(), pulled(), failed(), unchanged_local + unchanged_remote);
    if (skipped_remote) out += fmt::format(", {} skipped", skipped_remote);
    if (duplicate_remote) out += fmt::format(", {} duplicate", duplicate_remote);
    return out;
}

void to_json(nlohmann::json& j, const Outcome& o) {
    j = {
        {"key", o.key},
        {"action", to_string(o.action)},
        {"status", to_string(o.status)}
    };
    if (!o.reason.empty()) j["reason"] = o.reason;
}

void to_json(nlohmann::json& j, const Report& r) {
    j = {
        {"begin", util::timestampToString(r.begin)},
        {"end", util::timestampToString(r.end)},
        {"pushed", r.pushed()},
        {"pulled", r.pulled()},
        {"failed", r.failed()},
        {"unchanged_local", r.unchanged_local},
        {"unchanged_remote", r.unchanged_remote},
        {"skipped_remote", r.skipped_remote},
        {"duplicate_remote", r.duplicate_remote},
        {"interrupted", r.interrupted},
        {"outcomes", r.outcomes}
    };
}

}
