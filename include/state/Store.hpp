#pragma once

#include "state/SyncConfig.hpp"

#include <filesystem>
#include <string>

namespace mds::state {

// Loads and saves the per-directory SyncConfig file. Saves are all-or-nothing.
class Store {
public:
    explicit Store(std::filesystem::path file);

    [[nodiscard]] static Store forDirectory(const std::filesystem::path& dir, const std::string& filename);

    [[nodiscard]] bool exists() const;

    // Throws NotInitializedError when the file is absent and PersistenceError when it cannot be parsed.
    [[nodiscard]] SyncConfig load() const;

    // Throws PersistenceError; the previous file stays intact on failure.
    void save(const SyncConfig& config) const;

    [[nodiscard]] const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;
};

}
