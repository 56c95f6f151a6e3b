#pragma once

#include "util/timestamp.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mds::convert { class Converter; }
namespace mds::remote { class Store; }

namespace mds::sync {

// Shared state of one reconciliation run, handed to every task.
struct Session {
    std::shared_ptr<convert::Converter> converter;
    std::shared_ptr<remote::Store> store;
    std::filesystem::path localDir;
    std::filesystem::path scratch;
    std::string localExtension;
    std::string remoteExtension;
    std::chrono::milliseconds convertTimeout{0};
    std::function<util::Timestamp()> clock;
    std::function<bool()> interrupted;

    // Raised by the first task that hits a remote failure; tasks not yet started skip their work.
    std::shared_ptr<std::atomic<bool>> failed = std::make_shared<std::atomic<bool>>(false);

    void abort() const { failed->store(true); }
    [[nodiscard]] bool aborted() const { return failed->load(); }

    [[nodiscard]] bool stopRequested() const { return aborted() || (interrupted && interrupted()); }

    // Reason recorded on a task that never started.
    [[nodiscard]] const char* stopReason() const {
        return aborted() ? "aborted after remote failure" : "interrupted";
    }

    // Per-task scratch subdirectory, unique within the run.
    [[nodiscard]] std::filesystem::path stagingDirFor(std::string_view phase, const std::string& key) const;
};

}
