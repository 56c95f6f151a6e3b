#include "sync/Session.hpp"

using namespace mds::sync;

std::filesystem::path Session::stagingDirFor(const std::string_view phase, const std::string& key) const {
    return scratch / std::string(phase) / key;
}
