#include "runtime/Interrupt.hpp"

#include <atomic>
#include <csignal>

namespace {

std::atomic<bool> flag{false};

static_assert(std::atomic<bool>::is_always_lock_free);

void signalHandler(const int signum) {
    flag.store(true);
    std::signal(signum, SIG_DFL);
}

}

namespace mds::runtime {

void Interrupt::install() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool Interrupt::requested() { return flag.load(); }

void Interrupt::reset() { flag.store(false); }

}
