#pragma once

#include "remote/Store.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace mds::remote {

// A plain directory standing in for the remote collection, typically a mounted
// Google Drive folder. The document location is its file name. Every call gives up
// after `timeout` so a hung mount cannot stall the run; zero waits forever.
class MountStore final : public Store {
public:
    MountStore(std::filesystem::path root, std::string extension,
               std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    [[nodiscard]] std::vector<RemoteDocument> listDocuments() override;

    void fetch(const std::string& location, const std::filesystem::path& dest) override;

    std::string store(const std::string& name, const std::filesystem::path& src) override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::string extension_;
    std::chrono::milliseconds timeout_;

    [[nodiscard]] std::filesystem::path resolve(const std::string& location) const;
};

}
