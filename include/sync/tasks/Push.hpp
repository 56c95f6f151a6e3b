#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/Outcome.hpp"

#include <memory>

namespace mds::sync { struct Session; }

namespace mds::sync::tasks {

// Convert a local document into the remote encoding and store it remotely.
struct Push final : concurrency::PromisedTask<model::Outcome> {
    std::shared_ptr<const Session> session;
    model::Action action;

    Push(std::shared_ptr<const Session> s, model::Action a);

    void operator()() override;
};

}
