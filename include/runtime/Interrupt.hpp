#pragma once

namespace mds::runtime {

// SIGINT/SIGTERM set a flag that running syncs poll between documents. A second
// signal falls through to the default action.
struct Interrupt {
    static void install();

    [[nodiscard]] static bool requested();

    static void reset();
};

}
