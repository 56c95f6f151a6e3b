#include "state/Lock.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace mds::state;
namespace fs = std::filesystem;

fs::path Lock::pathFor(const fs::path& stateFile) {
    return stateFile.parent_path() / (stateFile.filename().string() + ".lock");
}

Lock::Lock(fs::path lockFile) : path_(std::move(lockFile)) {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
        throw SetupError(fmt::format("Cannot open lock file {}: {}", path_.string(), std::strerror(errno)));

    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK)
            throw SyncInProgressError(fmt::format("sync already in progress for {}", path_.parent_path().string()));
        throw SetupError(fmt::format("Cannot lock {}: {}", path_.string(), std::strerror(err)));
    }

    log::Registry::state()->debug("[state::Lock] Acquired {}", path_.string());
}

Lock::~Lock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}
