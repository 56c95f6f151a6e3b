#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/Outcome.hpp"

#include <memory>

namespace mds::sync { struct Session; }

namespace mds::sync::tasks {

// Fetch a remote document, convert it to the local encoding and write it into the local directory.
struct Pull final : concurrency::PromisedTask<model::Outcome> {
    std::shared_ptr<const Session> session;
    model::Action action;

    Pull(std::shared_ptr<const Session> s, model::Action a);

    void operator()() override;
};

}
