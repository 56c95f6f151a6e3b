#include "sync/Executor.hpp"
#include "sync/Session.hpp"
#include "sync/tasks/Push.hpp"
#include "sync/tasks/Pull.hpp"
#include "concurrency/ThreadPool.hpp"
#include "state/SyncConfig.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <future>

using namespace mds::sync;
using namespace mds::sync::model;

Executor::Executor(std::shared_ptr<const Session> session, const unsigned int workers)
    : session_(std::move(session)), workers_(std::max(1u, workers)) {}

std::shared_ptr<mds::concurrency::PromisedTask<Outcome>> Executor::dispatch(const Action& action) const {
    switch (action.type) {
    case ActionType::Push: return std::make_shared<tasks::Push>(session_, action);
    case ActionType::Pull: return std::make_shared<tasks::Pull>(session_, action);
    }
    throw std::logic_error("Unknown sync action");
}

std::vector<Outcome> Executor::run(const std::vector<Action>& plan, state::SyncConfig& config) const {
    if (plan.empty()) return {};

    std::vector<std::future<Outcome>> futures;
    futures.reserve(plan.size());

    {
        concurrency::ThreadPool pool(std::min<unsigned int>(workers_, static_cast<unsigned int>(plan.size())));
        for (const auto& action : plan) {
            auto task = dispatch(action);
            futures.push_back(task->getFuture());
            pool.submit(task);
        }
        pool.stop();
    }

    // barrier
    std::vector<Outcome> outcomes;
    outcomes.reserve(futures.size());
    for (auto& f : futures) outcomes.push_back(f.get());

    for (const auto& o : outcomes)
        if (o.fatal) std::rethrow_exception(o.fatal);

    for (const auto& o : outcomes)
        if (o.ok() && o.record) config.files[o.key] = *o.record;

    return outcomes;
}
