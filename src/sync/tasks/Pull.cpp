#include "sync/tasks/Pull.hpp"
#include "sync/Session.hpp"
#include "convert/Converter.hpp"
#include "remote/Store.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace mds::sync::tasks;
using namespace mds::sync::model;
namespace fs = std::filesystem;

Pull::Pull(std::shared_ptr<const Session> s, Action a) : session(std::move(s)), action(std::move(a)) {}

void Pull::operator()() {
    Outcome out{ActionType::Pull, action.key};

    if (session->stopRequested()) {
        out.reason = fmt::format("{} before pulling", session->stopReason());
        promise.set_value(std::move(out));
        return;
    }

    try {
        const auto& remote = action.remote.value();

        const auto staging = session->stagingDirFor("pull", action.key);
        fs::create_directories(staging);
        const auto fetched = staging / ("fetched" + session->remoteExtension);
        const auto converted = staging / action.key;

        session->store->fetch(remote.location, fetched);
        session->converter->convert(fetched, converted, convert::Direction::ToLocal, session->convertTimeout);

        const auto dest = session->localDir / action.key;
        util::replaceAtomically(converted, dest);

        const auto stamp = session->clock();
        out.record = state::SyncRecord{remote.location, stamp, util::modifiedTime(dest)};
        out.status = Outcome::Status::Pulled;
        log::Registry::sync()->info("[Pull] {} -> {}", remote.name, action.key);
    } catch (const RemoteError& e) {
        out.reason = e.what();
        out.fatal = std::current_exception();
        session->abort();
        log::Registry::sync()->error("[Pull] Remote failure while pulling {}: {}", action.key, e.what());
    } catch (const std::exception& e) {
        out.reason = e.what();
        log::Registry::sync()->warn("[Pull] Skipping {}: {}", action.key, e.what());
    }

    promise.set_value(std::move(out));
}
