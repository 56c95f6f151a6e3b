#pragma once

#include "remote/Descriptor.hpp"
#include "config/Config.hpp"

#include <memory>
#include <string>

namespace mds::remote {

class Store;

// Builds stores for persisted descriptors. Virtual so tests can hand the engine a
// store of their own without touching the network.
class Factory {
public:
    Factory(config::RemoteConfig remote, std::string remoteExtension);
    virtual ~Factory() = default;

    [[nodiscard]] virtual std::shared_ptr<Store> open(const Descriptor& descriptor) const;

    // Turns the user's init argument into a descriptor: a Drive folder name
    // (found or created) or an existing mount directory.
    [[nodiscard]] virtual Descriptor resolve(Backend backend, const std::string& target) const;

protected:
    config::RemoteConfig remote_;
    std::string extension_;

    [[nodiscard]] std::string accessToken() const;
};

}
