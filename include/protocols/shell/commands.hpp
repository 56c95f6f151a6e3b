#pragma once

#include <memory>

namespace mds::runtime { struct Context; }

namespace mds::shell {

class Router;

void registerSystemCommands(const std::shared_ptr<Router>& r);
void registerSyncCommands(const std::shared_ptr<Router>& r, const runtime::Context& ctx);

inline void registerAllCommands(const std::shared_ptr<Router>& r, const runtime::Context& ctx) {
    registerSyncCommands(r, ctx);
    registerSystemCommands(r);
}

}
