#include "sync/Inventory.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace mds::sync;
using namespace mds::sync::model;
namespace fs = std::filesystem;

std::vector<LocalDocument> Inventory::scanLocal(const fs::path& dir, const std::string& extension) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        throw SetupError(fmt::format("Local directory {} does not exist or is not a directory", dir.string()));

    std::vector<LocalDocument> docs;
    try {
        for (const auto& entry : fs::directory_iterator(dir)) {
            const auto name = entry.path().filename().string();
            if (name.starts_with(".")) continue;
            if (entry.path().extension() != extension) continue;
            if (!entry.is_regular_file()) continue;
            docs.push_back({name, entry.path(), util::modifiedTime(entry.path())});
        }
    } catch (const fs::filesystem_error& e) {
        throw SetupError(fmt::format("Failed to scan {}: {}", dir.string(), e.what()));
    }

    std::ranges::sort(docs, {}, &LocalDocument::name);
    log::Registry::sync()->debug("[Inventory] {} local documents in {}", docs.size(), dir.string());
    return docs;
}
