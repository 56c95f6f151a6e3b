#pragma once

#include "config/Config.hpp"
#include "runtime/Interrupt.hpp"
#include "util/timestamp.hpp"

#include <functional>
#include <memory>

namespace mds::convert { class Converter; }
namespace mds::remote { class Factory; }

namespace mds::runtime {

// Everything one command needs, constructed once in main and passed down explicitly.
struct Context {
    config::Config config;
    std::shared_ptr<convert::Converter> converter;
    std::shared_ptr<remote::Factory> remotes;
    std::function<util::Timestamp()> clock = util::now;
    std::function<bool()> interrupted = Interrupt::requested;

    // Wires the pandoc converter and the real remote factory from config.
    [[nodiscard]] static Context fromConfig(config::Config cfg);
};

}
