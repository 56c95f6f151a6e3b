#pragma once

#include <filesystem>

namespace mds::sync {

// Scratch directory for conversion intermediates, removed when the run ends on any path.
class Workspace {
public:
    explicit Workspace(const std::filesystem::path& parent = std::filesystem::temp_directory_path());
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
