#pragma once

#include "sync/model/Document.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mds::sync {

struct Inventory {
    // Regular, non-hidden files with the given extension, sorted by name.
    static std::vector<model::LocalDocument> scanLocal(const std::filesystem::path& dir, const std::string& extension);
};

}
