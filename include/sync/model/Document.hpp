#pragma once

#include "util/timestamp.hpp"

#include <filesystem>
#include <string>

namespace mds::sync::model {

struct LocalDocument {
    std::string name;               // file name, also the SyncRecord key
    std::filesystem::path path;
    util::Timestamp modified;
};

}
