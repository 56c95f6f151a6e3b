#pragma once

#include "util/timestamp.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mds::state {

// Last successful synchronization point for one document, keyed by its local file name.
struct SyncRecord {
    std::string remote_location;
    std::optional<util::Timestamp> last_upload;   // stamped with the engine clock after a push or pull
    std::optional<util::Timestamp> local_mtime;   // local mtime observed at that point

    // A record that never completed a transfer forces a sync, same as no record.
    [[nodiscard]] bool hasBaseline() const { return last_upload.has_value(); }
};

void to_json(nlohmann::json& j, const SyncRecord& r);
void from_json(const nlohmann::json& j, SyncRecord& r);

}
