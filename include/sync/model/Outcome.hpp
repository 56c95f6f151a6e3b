#pragma once

#include "sync/model/Action.hpp"
#include "state/Record.hpp"

#include <exception>
#include <optional>
#include <string>

namespace mds::sync::model {

struct Outcome {
    enum class Status { Pushed, Pulled, Failed };

    ActionType action{ActionType::Push};
    std::string key;
    Status status{Status::Failed};
    std::string reason{};                   // failure message
    std::optional<state::SyncRecord> record{};
    std::exception_ptr fatal{};             // connectivity/auth failure that must end the run

    [[nodiscard]] bool ok() const { return status != Status::Failed; }
};

std::string_view to_string(Outcome::Status status);

}
