#pragma once

#include "remote/Store.hpp"
#include "remote/Descriptor.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <optional>
#include <string>

namespace mds::remote {

// Google Drive v3 REST store. Only documents of the wordprocessingml MIME type inside
// one folder are part of the collection.
class DriveStore final : public Store {
public:
    static constexpr const auto* DOCX_MIME = "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    static constexpr const auto* FOLDER_MIME = "application/vnd.google-apps.folder";

    DriveStore(config::RemoteConfig cfg, std::string accessToken,
               std::string folderId = {}, std::string folderName = {});

    [[nodiscard]] std::vector<RemoteDocument> listDocuments() override;

    void fetch(const std::string& location, const std::filesystem::path& dest) override;

    std::string store(const std::string& name, const std::filesystem::path& src) override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] Descriptor findOrCreateFolder(const std::string& name) const;

    // Reads the bearer token ("token" or "access_token") from a token JSON file.
    [[nodiscard]] static std::string loadAccessToken(const std::filesystem::path& tokenFile);

    [[nodiscard]] static std::string quoteQueryLiteral(const std::string& value);

    // Drive search expression selecting the untrashed documents directly inside folderId.
    [[nodiscard]] static std::string listQuery(const std::string& folderId);

private:
    config::RemoteConfig cfg_;
    std::string token_;
    std::string folderId_;
    std::string folderName_;

    [[nodiscard]] SList headers(const std::string& contentType = {}) const;

    void applyTimeouts(CURL* h) const;

    [[nodiscard]] HttpResponse getJson(const std::string& url) const;
    [[nodiscard]] HttpResponse postJson(const std::string& url, const std::string& body) const;

    [[nodiscard]] std::optional<std::string> findFileId(const std::string& name) const;
    [[nodiscard]] std::string createFile(const std::string& name) const;
    void uploadMedia(const std::string& fileId, const std::filesystem::path& src) const;
};

}
