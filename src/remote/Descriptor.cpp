#include "remote/Descriptor.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

namespace mds::remote {

std::string to_string(const Backend b) {
    switch (b) {
    case Backend::Drive: return "drive";
    case Backend::Mount: return "mount";
    }
    return "unknown";
}

Backend backendFromString(const std::string& str) {
    if (str == "drive" || str == "api") return Backend::Drive;
    if (str == "mount" || str == "fs" || str == "filesystem") return Backend::Mount;
    throw std::invalid_argument("Unknown remote backend: " + str);
}

std::string to_string(const Descriptor& d) {
    if (d.backend == Backend::Drive) return "Google Drive folder '" + d.folder_name + "' (" + d.folder_id + ")";
    return "mounted folder " + d.path.string();
}

void to_json(nlohmann::json& j, const Descriptor& d) {
    j = nlohmann::json{{"backend", to_string(d.backend)}};
    if (d.backend == Backend::Drive) {
        j["folder_id"] = d.folder_id;
        j["folder_name"] = d.folder_name;
    } else {
        j["path"] = d.path.string();
    }
}

void from_json(const nlohmann::json& j, Descriptor& d) {
    d.backend = backendFromString(j.at("backend").get<std::string>());
    if (d.backend == Backend::Drive) {
        d.folder_id = j.at("folder_id").get<std::string>();
        d.folder_name = j.value("folder_name", std::string{});
    } else {
        d.path = j.at("path").get<std::string>();
    }
}

}
