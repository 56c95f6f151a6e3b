#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace mds::util::process {

struct Result {
    int exit_code = -1;
    std::string output; // merged stdout/stderr, tail-capped

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// Runs argv[0] from PATH with stdin on /dev/null. A non-positive timeout waits forever.
// Throws ProcessError if the child cannot be spawned and ProcessTimeout (after
// killing the child) when the deadline passes.
Result run(const std::vector<std::string>& argv,
           std::chrono::milliseconds timeout,
           const std::filesystem::path& cwd = {});

}
