#include "remote/MountStore.hpp"
#include "concurrency/Deadline.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace mds::remote;
using namespace mds::util;
namespace fs = std::filesystem;

namespace {

// The folder helpers below run on a deadline thread and only see copies of their inputs.

void requireFolder(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw mds::RemoteError(fmt::format("Remote folder {} is not reachable", root.string()));
}

std::vector<RemoteDocument> scanFolder(const fs::path& root, const std::string& extension, const std::string& what) {
    requireFolder(root);

    std::vector<RemoteDocument> docs;
    try {
        for (const auto& entry : fs::directory_iterator(root)) {
            const auto name = entry.path().filename().string();
            if (name.starts_with(".")) continue;
            if (!entry.is_regular_file()) continue;
            if (entry.path().extension() != extension) continue;
            docs.push_back({name, name, modifiedTime(entry.path())});
        }
    } catch (const fs::filesystem_error& e) {
        throw mds::RemoteError(fmt::format("Failed to list {}: {}", what, e.what()));
    } catch (const mds::Error& e) {
        throw mds::RemoteError(fmt::format("Failed to list {}: {}", what, e.what()));
    }

    std::ranges::sort(docs, {}, &RemoteDocument::name);
    return docs;
}

}

MountStore::MountStore(fs::path root, std::string extension, const std::chrono::milliseconds timeout)
    : root_(std::move(root)), extension_(std::move(extension)), timeout_(timeout) {}

std::string MountStore::describe() const {
    return fmt::format("mounted folder {}", root_.string());
}

fs::path MountStore::resolve(const std::string& location) const {
    const fs::path name(location);
    if (location.empty() || name.has_parent_path() || location == "." || location == "..")
        throw TransferError(fmt::format("Invalid document location '{}' for {}", location, describe()));
    return root_ / name;
}

std::vector<RemoteDocument> MountStore::listDocuments() {
    const auto what = describe();
    return concurrency::withDeadline<RemoteError>(timeout_, "Listing " + what,
        [root = root_, extension = extension_, what] { return scanFolder(root, extension, what); });
}

void MountStore::fetch(const std::string& location, const fs::path& dest) {
    const auto src = resolve(location);

    concurrency::withDeadline<TransferError>(timeout_, fmt::format("Fetching {}", location), [src, dest, location] {
        std::error_code ec;
        fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            log::Registry::remote()->warn("[MountStore] Failed to copy {}: {}", src.string(), ec.message());
            throw TransferError(fmt::format("Failed to fetch {}: {}", location, ec.message()));
        }
    });
}

std::string MountStore::store(const std::string& name, const fs::path& src) {
    const auto dest = resolve(name);

    concurrency::withDeadline<TransferError>(timeout_, fmt::format("Storing {}", name), [root = root_, src, dest, name] {
        requireFolder(root);
        try {
            replaceAtomically(src, dest);
        } catch (const std::exception& e) {
            log::Registry::remote()->warn("[MountStore] Failed to store {}: {}", dest.string(), e.what());
            throw TransferError(fmt::format("Failed to store {}: {}", name, e.what()));
        }
    });

    return name;
}
