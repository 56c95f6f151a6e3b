#pragma once

#include "protocols/shell/CommandUsage.hpp"

namespace mds::shell {

class SyncUsage {
public:
    [[nodiscard]] static CommandUsage init();
    [[nodiscard]] static CommandUsage update();
    [[nodiscard]] static CommandUsage status();
};

}
