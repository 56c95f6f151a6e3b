#pragma once

#include "sync/model/Document.hpp"
#include "remote/Store.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mds::sync::model {

enum class ActionType {
    Push,
    Pull,
};

std::string_view to_string(ActionType type);

struct Action {
    ActionType type{ActionType::Push};
    std::string key;                              // local file name
    std::optional<LocalDocument> local{};         // set for Push
    std::optional<remote::RemoteDocument> remote{}; // set for Pull
};

}
