#include "state/SyncConfig.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

json timestampOrNull(const std::optional<mds::util::Timestamp>& ts) {
    if (!ts) return nullptr;
    return mds::util::timestampToString(*ts);
}

std::optional<mds::util::Timestamp> optionalTimestamp(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return mds::util::parseTimestamp(j.at(key).get<std::string>());
}

}

namespace mds::state {

void to_json(json& j, const SyncRecord& r) {
    j = json{
        {"remote_location", r.remote_location},
        {"last_upload", timestampOrNull(r.last_upload)},
        {"local_mtime", timestampOrNull(r.local_mtime)}
    };
}

void from_json(const json& j, SyncRecord& r) {
    r.remote_location = j.value("remote_location", std::string{});
    r.last_upload = optionalTimestamp(j, "last_upload");
    r.local_mtime = optionalTimestamp(j, "local_mtime");
}

const SyncRecord* SyncConfig::find(const std::string& name) const {
    const auto it = files.find(name);
    return it == files.end() ? nullptr : &it->second;
}

void to_json(json& j, const SyncConfig& c) {
    j = json{
        {"local_path", c.local_path.string()},
        {"remote", c.remote},
        {"last_sync", timestampOrNull(c.last_sync)},
        {"files", json::object()}
    };
    for (const auto& [name, record] : c.files) j["files"][name] = record;
}

void from_json(const json& j, SyncConfig& c) {
    c.local_path = j.at("local_path").get<std::string>();
    c.remote = j.at("remote").get<remote::Descriptor>();
    c.last_sync = optionalTimestamp(j, "last_sync");
    c.files.clear();
    if (j.contains("files") && j.at("files").is_object())
        for (const auto& [name, record] : j.at("files").items())
            c.files.emplace(name, record.get<SyncRecord>());
}

}
