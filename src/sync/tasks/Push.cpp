#include "sync/tasks/Push.hpp"
#include "sync/Session.hpp"
#include "sync/Planner.hpp"
#include "convert/Converter.hpp"
#include "remote/Store.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace mds::sync::tasks;
using namespace mds::sync::model;
namespace fs = std::filesystem;

Push::Push(std::shared_ptr<const Session> s, Action a) : session(std::move(s)), action(std::move(a)) {}

void Push::operator()() {
    Outcome out{ActionType::Push, action.key};

    if (session->stopRequested()) {
        out.reason = fmt::format("{} before pushing", session->stopReason());
        promise.set_value(std::move(out));
        return;
    }

    try {
        const auto& local = action.local.value();
        const auto remoteName = Planner::remoteNameFor(local.name, session->localExtension, session->remoteExtension);

        const auto staging = session->stagingDirFor("push", local.name);
        fs::create_directories(staging);
        const auto converted = staging / remoteName;

        session->converter->convert(local.path, converted, convert::Direction::ToRemote, session->convertTimeout);
        const auto location = session->store->store(remoteName, converted);

        out.record = state::SyncRecord{location, session->clock(), local.modified};
        out.status = Outcome::Status::Pushed;
        log::Registry::sync()->info("[Push] {} -> {}", local.name, remoteName);
    } catch (const RemoteError& e) {
        out.reason = e.what();
        out.fatal = std::current_exception();
        session->abort();
        log::Registry::sync()->error("[Push] Remote failure while pushing {}: {}", action.key, e.what());
    } catch (const std::exception& e) {
        out.reason = e.what();
        log::Registry::sync()->warn("[Push] Skipping {}: {}", action.key, e.what());
    }

    promise.set_value(std::move(out));
}
