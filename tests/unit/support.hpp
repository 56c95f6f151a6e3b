#pragma once

#include "convert/Converter.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <sys/stat.h>
#include <fcntl.h>

namespace mds::test {

namespace fs = std::filesystem;

inline fs::path makeTestDir(const std::string& tag) {
    const auto dir = fs::temp_directory_path() / ("mdsync_test_" + tag + "_" + util::generate_random_suffix());
    fs::create_directories(dir);
    return dir;
}

inline void writeTextFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void setModifiedTime(const fs::path& path, const util::Timestamp ts) {
    const auto us = ts.time_since_epoch().count();
    timespec times[2];
    times[0].tv_sec = static_cast<time_t>(us / 1'000'000);
    times[0].tv_nsec = static_cast<long>((us % 1'000'000) * 1000);
    times[1] = times[0];
    ASSERT_EQ(::utimensat(AT_FDCWD, path.c_str(), times, 0), 0) << "utimensat failed for " << path;
}

// Stands in for pandoc: prefixes the content with the direction, fails for chosen file names.
class FakeConverter final : public convert::Converter {
public:
    std::set<std::string> failFor;      // input file names that fail
    std::atomic<int> calls{0};

    void convert(const fs::path& input, const fs::path& output,
                 const convert::Direction direction, std::chrono::milliseconds) override {
        ++calls;
        {
            std::scoped_lock lock(mutex_);
            if (failFor.contains(input.filename().string()))
                throw ConversionError("forced conversion failure for " + input.filename().string());
        }
        const auto body = util::readFileToString(input);
        util::writeFileAtomically(output, std::string(convert::to_string(direction)) + ":" + body);
    }

private:
    std::mutex mutex_;
};

}
