#pragma once

#include "state/Record.hpp"
#include "remote/Descriptor.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mds::state {

struct SyncConfig {
    std::filesystem::path local_path;
    remote::Descriptor remote;
    std::optional<util::Timestamp> last_sync;
    std::map<std::string, SyncRecord> files;

    [[nodiscard]] const SyncRecord* find(const std::string& name) const;
};

void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);

}
