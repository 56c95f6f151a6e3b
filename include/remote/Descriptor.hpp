#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mds::remote {

enum class Backend { Drive, Mount };

// Where the remote collection lives. Persisted inside the per-directory SyncConfig.
struct Descriptor {
    Backend backend{Backend::Mount};

    // Drive
    std::string folder_id;
    std::string folder_name;

    // Mount
    std::filesystem::path path;
};

std::string to_string(Backend b);
Backend backendFromString(const std::string& str);

std::string to_string(const Descriptor& d);

void to_json(nlohmann::json& j, const Descriptor& d);
void from_json(const nlohmann::json& j, Descriptor& d);

}
