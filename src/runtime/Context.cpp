#include "runtime/Context.hpp"
#include "convert/Pandoc.hpp"
#include "remote/Factory.hpp"

using namespace mds::runtime;

Context Context::fromConfig(config::Config cfg) {
    Context ctx;
    ctx.converter = std::make_shared<convert::Pandoc>(cfg.converter);
    ctx.remotes = std::make_shared<remote::Factory>(cfg.remote, cfg.sync.remote_extension);
    ctx.config = std::move(cfg);
    return ctx;
}
