#include "remote/Factory.hpp"
#include "remote/DriveStore.hpp"
#include "remote/MountStore.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>

using namespace mds::remote;
namespace fs = std::filesystem;

Factory::Factory(config::RemoteConfig remote, std::string remoteExtension)
    : remote_(std::move(remote)), extension_(std::move(remoteExtension)) {}

std::string Factory::accessToken() const {
    return DriveStore::loadAccessToken(remote_.drive.token_file);
}

std::shared_ptr<Store> Factory::open(const Descriptor& descriptor) const {
    switch (descriptor.backend) {
        case Backend::Drive:
            if (descriptor.folder_id.empty())
                throw SetupError("Drive remote has no folder id; re-run init");
            return std::make_shared<DriveStore>(remote_, accessToken(), descriptor.folder_id, descriptor.folder_name);
        case Backend::Mount:
            if (descriptor.path.empty())
                throw SetupError("Mount remote has no path; re-run init");
            return std::make_shared<MountStore>(descriptor.path, extension_,
                                                std::chrono::duration_cast<std::chrono::milliseconds>(remote_.timeout));
    }
    throw SetupError("Unknown remote backend");
}

Descriptor Factory::resolve(const Backend backend, const std::string& target) const {
    if (target.empty()) throw SetupError("Remote target must not be empty");

    if (backend == Backend::Drive) {
        const DriveStore drive(remote_, accessToken());
        return drive.findOrCreateFolder(target);
    }

    std::error_code ec;
    const auto path = fs::weakly_canonical(fs::absolute(target), ec);
    if (ec || !fs::is_directory(path, ec))
        throw SetupError(fmt::format("Remote folder {} does not exist or is not a directory", target));

    Descriptor d;
    d.backend = Backend::Mount;
    d.path = path;
    return d;
}
