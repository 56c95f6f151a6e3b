#include "util/process.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <fmt/core.h>

using namespace std::chrono;

namespace {

constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;

int decodeStatus(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void appendCapped(std::string& out, const char* data, const size_t n) {
    out.append(data, n);
    if (out.size() > MAX_CAPTURED_OUTPUT) out.erase(0, out.size() - MAX_CAPTURED_OUTPUT);
}

void killAndReap(const pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

}

namespace mds::util::process {

Result run(const std::vector<std::string>& argv, const milliseconds timeout, const std::filesystem::path& cwd) {
    if (argv.empty()) throw ProcessError("Cannot run an empty command");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const std::string workdir = cwd.string();

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) == -1)
        throw ProcessError(fmt::format("Failed to create output pipe for '{}': {}", argv[0], std::strerror(errno)));

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        throw ProcessError(fmt::format("Failed to fork for '{}': {}", argv[0], std::strerror(errno)));
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::dup2(pipefd[1], STDERR_FILENO);
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) _exit(126);
        ::execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    ::close(pipefd[1]);

    const bool bounded = timeout.count() > 0;
    const auto deadline = steady_clock::now() + timeout;

    const auto remainingMs = [&]() -> int {
        if (!bounded) return -1;
        const auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    };

    const auto timedOut = [&] {
        ::close(pipefd[0]);
        killAndReap(pid);
        log::Registry::mdsync()->warn("[process] '{}' exceeded its {}ms limit and was killed", argv[0], timeout.count());
        return ProcessTimeout(fmt::format("'{}' timed out after {}ms", argv[0], timeout.count()));
    };

    Result result;
    char buf[4096];

    for (;;) {
        pollfd pfd{pipefd[0], POLLIN, 0};
        const int wait = remainingMs();
        if (bounded && wait == 0) throw timedOut();

        const int rc = ::poll(&pfd, 1, wait);
        if (rc < 0) {
            if (errno == EINTR) continue;
            ::close(pipefd[0]);
            killAndReap(pid);
            throw ProcessError(fmt::format("poll failed while running '{}': {}", argv[0], std::strerror(errno)));
        }
        if (rc == 0) throw timedOut();

        const ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break; // EOF
        appendCapped(result.output, buf, static_cast<size_t>(n));
    }

    ::close(pipefd[0]);

    int status = 0;
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) throw ProcessError(fmt::format("waitpid failed for '{}': {}", argv[0], std::strerror(errno)));
        if (bounded && steady_clock::now() >= deadline) {
            killAndReap(pid);
            throw ProcessTimeout(fmt::format("'{}' timed out after {}ms", argv[0], timeout.count()));
        }
        std::this_thread::sleep_for(milliseconds(10));
    }

    result.exit_code = decodeStatus(status);
    return result;
}

}
