#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/Outcome.hpp"
#include "concurrency/Task.hpp"

#include <memory>
#include <vector>

namespace mds::state { struct SyncConfig; }

namespace mds::sync {

struct Session;

class Executor {
public:
    Executor(std::shared_ptr<const Session> session, unsigned int workers);

    // Runs every action, waits for all of them, then folds successful records into
    // the mapping in plan order. A remote/auth failure is rethrown after the barrier
    // and leaves the mapping untouched.
    std::vector<model::Outcome> run(const std::vector<model::Action>& plan, state::SyncConfig& config) const;

private:
    std::shared_ptr<const Session> session_;
    unsigned int workers_;

    [[nodiscard]] std::shared_ptr<concurrency::PromisedTask<model::Outcome>> dispatch(const model::Action& action) const;
};

}
