#pragma once

#include <filesystem>

namespace mds::state {

// Advisory exclusive flock held for the lifetime of one run. A second holder on the
// same lock file fails immediately with SyncInProgressError.
class Lock {
public:
    explicit Lock(std::filesystem::path lockFile);
    ~Lock();

    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    [[nodiscard]] static std::filesystem::path pathFor(const std::filesystem::path& stateFile);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
};

}
