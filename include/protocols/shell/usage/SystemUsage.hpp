#pragma once

#include "protocols/shell/CommandUsage.hpp"

namespace mds::shell {

class SystemUsage {
public:
    [[nodiscard]] static CommandUsage help();
    [[nodiscard]] static CommandUsage version();
};

}
