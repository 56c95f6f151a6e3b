#include "util/files.hpp"
#include "util/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(const int fd) : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const { return fd_; }

    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

std::string errnoMessage(const std::string_view what, const fs::path& path) {
    return fmt::format("{} '{}': {}", what, path.string(), std::strerror(errno));
}

void writeAll(const int fd, const char* data, size_t size, const fs::path& path) {
    while (size > 0) {
        const ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw mds::Error(errnoMessage("Failed to write", path));
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

void syncDirectory(const fs::path& dir) {
    const FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.get() >= 0) ::fsync(fd.get());
}

// Fills a sibling temp file through fill(fd, tmp), fsyncs it, renames it over dest
// and fsyncs the directory. The temp file is gone on every failure path.
template <typename Fill>
void publish(const fs::path& dest, Fill&& fill) {
    const auto tmp = mds::util::tempSiblingFor(dest);

    {
        FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (fd.get() < 0) throw mds::Error(errnoMessage("Failed to create temp file", tmp));

        try {
            fill(fd.get(), tmp);
            if (::fsync(fd.get()) != 0) throw mds::Error(errnoMessage("Failed to fsync", tmp));
        } catch (...) {
            ::close(fd.release());
            ::unlink(tmp.c_str());
            throw;
        }

        if (::close(fd.release()) != 0) {
            const auto msg = errnoMessage("Failed to close", tmp);
            ::unlink(tmp.c_str());
            throw mds::Error(msg);
        }
    }

    if (::rename(tmp.c_str(), dest.c_str()) != 0) {
        const auto msg = errnoMessage("Failed to move temp file into place for", dest);
        ::unlink(tmp.c_str());
        throw mds::Error(msg);
    }

    syncDirectory(dest.has_parent_path() ? dest.parent_path() : fs::path("."));
}

}

namespace mds::util {

std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw Error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw Error("Failed to read file: " + path.string());

    return buffer;
}

fs::path tempSiblingFor(const fs::path& dest) {
    return dest.parent_path() / fmt::format(".{}.tmp-{}", dest.filename().string(), generate_random_suffix());
}

void writeFileAtomically(const fs::path& dest, const std::string_view content) {
    publish(dest, [&](const int fd, const fs::path& tmp) { writeAll(fd, content.data(), content.size(), tmp); });
}

void replaceAtomically(const fs::path& src, const fs::path& dest) {
    const FileDescriptor in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) throw Error(errnoMessage("Failed to open", src));

    publish(dest, [&](const int fd, const fs::path& tmp) {
        char buf[64 * 1024];
        for (;;) {
            const ssize_t n = ::read(in.get(), buf, sizeof(buf));
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                throw Error(errnoMessage("Failed to read", src));
            }
            writeAll(fd, buf, static_cast<size_t>(n), tmp);
        }
    });
}

Timestamp modifiedTime(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) throw Error(errnoMessage("Failed to stat", path));
    return fromTimespec(st.st_mtim);
}

std::string generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

fs::path expandHome(const fs::path& path) {
    const auto str = path.string();
    if (str.empty() || str[0] != '~') return path;
    if (str.size() > 1 && str[1] != '/') return path;

    const char* home = std::getenv("HOME");
    if (!home) return path;
    return str.size() > 2 ? fs::path(home) / str.substr(2) : fs::path(home);
}

}
