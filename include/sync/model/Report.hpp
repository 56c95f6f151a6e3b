#pragma once

#include "sync/model/Outcome.hpp"
#include "util/timestamp.hpp"

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mds::sync::model {

struct Report {
    util::Timestamp begin{};
    util::Timestamp end{};
    std::vector<Outcome> outcomes;
    std::size_t unchanged_local = 0;
    std::size_t unchanged_remote = 0;
    std::size_t skipped_remote = 0;        // remote names with no usable local file name
    std::size_t duplicate_remote = 0;      // older copies shadowed by a newer one of the same name
    bool interrupted = false;              // stopped by a signal; remaining documents retry next run

    [[nodiscard]] std::size_t pushed() const;
    [[nodiscard]] std::size_t pulled() const;
    [[nodiscard]] std::size_t failed() const;

    [[nodiscard]] bool hasWarnings() const { return failed() > 0; }

    // "2 pushed, 1 pulled, 0 failed, 3 unchanged", then ", 1 skipped, 1 duplicate" when those happened
    [[nodiscard]] std::string summary() const;
};

void to_json(nlohmann::json& j, const Outcome& o);
void to_json(nlohmann::json& j, const Report& r);

}
