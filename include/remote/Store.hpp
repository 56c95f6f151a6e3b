#pragma once

#include "util/timestamp.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mds::remote {

struct RemoteDocument {
    std::string name;     // e.g. "report.docx"
    std::string location; // backend id or path relative to the collection
    util::Timestamp modified{};
};

// One remote collection. Implementations must be safe to call from several
// executor workers at once.
class Store {
public:
    virtual ~Store() = default;

    // Throws RemoteError (fatal) when the collection cannot be reached.
    [[nodiscard]] virtual std::vector<RemoteDocument> listDocuments() = 0;

    // Throws TransferError; RemoteAuthError when credentials are rejected.
    virtual void fetch(const std::string& location, const std::filesystem::path& dest) = 0;

    // Create-or-overwrite by name. Returns the document's location.
    virtual std::string store(const std::string& name, const std::filesystem::path& src) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

}
