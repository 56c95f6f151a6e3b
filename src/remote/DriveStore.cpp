#include "remote/DriveStore.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace mds::remote;
using namespace mds::util;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

std::string describeFailure(const HttpResponse& resp) {
    if (resp.curl != CURLE_OK) return fmt::format("transport error: {}", curl_easy_strerror(resp.curl));
    return fmt::format("HTTP {}: {}", resp.http, resp.body);
}

bool unreachable(const HttpResponse& resp) {
    return resp.curl == CURLE_COULDNT_RESOLVE_PROXY || resp.curl == CURLE_COULDNT_RESOLVE_HOST ||
           resp.curl == CURLE_COULDNT_CONNECT;
}

// An unreachable Drive ends the run; anything else only fails the one document.
[[noreturn]] void throwTransferFailure(const HttpResponse& resp, const std::string& what) {
    const auto msg = fmt::format("{}: {}", what, describeFailure(resp));
    if (unreachable(resp)) throw mds::RemoteError(msg);
    throw mds::TransferError(msg);
}

}

DriveStore::DriveStore(config::RemoteConfig cfg, std::string accessToken, std::string folderId, std::string folderName)
    : cfg_(std::move(cfg)), token_(std::move(accessToken)), folderId_(std::move(folderId)), folderName_(std::move(folderName)) {
    if (token_.empty()) throw RemoteAuthError("DriveStore requires a non-empty access token");
    ensureCurlGlobalInit();
}

std::string DriveStore::describe() const {
    return fmt::format("Google Drive folder '{}' ({})", folderName_, folderId_);
}

std::string DriveStore::loadAccessToken(const fs::path& tokenFile) {
    if (!fs::exists(tokenFile))
        throw RemoteAuthError(fmt::format("No Drive credentials at {}; place an OAuth token JSON there", tokenFile.string()));

    json j;
    try {
        j = json::parse(readFileToString(tokenFile));
    } catch (const json::exception& e) {
        throw RemoteAuthError(fmt::format("Unreadable Drive token file {}: {}", tokenFile.string(), e.what()));
    }

    for (const auto* key : {"token", "access_token"})
        if (j.contains(key) && j.at(key).is_string() && !j.at(key).get<std::string>().empty())
            return j.at(key).get<std::string>();

    throw RemoteAuthError(fmt::format("Drive token file {} has no access token", tokenFile.string()));
}

std::string DriveStore::quoteQueryLiteral(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (const char c : value) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

SList DriveStore::headers(const std::string& contentType) const {
    SList h;
    h.add("Authorization: Bearer " + token_);
    h.add("Accept: application/json");
    if (!contentType.empty()) h.add("Content-Type: " + contentType);
    return h;
}

void DriveStore::applyTimeouts(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout.count()));
}

HttpResponse DriveStore::getJson(const std::string& url) const {
    const auto hdrs = headers();
    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        applyTimeouts(h);
    });
}

HttpResponse DriveStore::postJson(const std::string& url, const std::string& body) const {
    const auto hdrs = headers("application/json; charset=UTF-8");
    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        applyTimeouts(h);
    });
}

std::string DriveStore::listQuery(const std::string& folderId) {
    return fmt::format("{} in parents and mimeType='{}' and trashed=false", quoteQueryLiteral(folderId), DOCX_MIME);
}

std::vector<RemoteDocument> DriveStore::listDocuments() {
    const auto query = listQuery(folderId_);

    std::vector<RemoteDocument> docs;
    std::string pageToken;

    do {
        auto url = fmt::format("{}/files?q={}&spaces=drive&pageSize=1000&fields={}",
                               cfg_.drive.api_base, urlEscape(query),
                               urlEscape("nextPageToken,files(id,name,modifiedTime)"));
        if (!pageToken.empty()) url += "&pageToken=" + urlEscape(pageToken);

        const auto resp = getJson(url);
        if (resp.unauthorized()) throw RemoteAuthError("Drive rejected the access token while listing: " + describeFailure(resp));
        if (!resp.ok()) {
            log::Registry::remote()->error("[DriveStore] listDocuments failed: {}", describeFailure(resp));
            throw RemoteError(fmt::format("Failed to list {}: {}", describe(), describeFailure(resp)));
        }

        try {
            const auto j = json::parse(resp.body);
            for (const auto& f : j.value("files", json::array())) {
                docs.push_back({
                    f.at("name").get<std::string>(),
                    f.at("id").get<std::string>(),
                    parseTimestamp(f.at("modifiedTime").get<std::string>())
                });
            }
            pageToken = j.value("nextPageToken", std::string{});
        } catch (const json::exception& e) {
            throw RemoteError(fmt::format("Malformed Drive listing response: {}", e.what()));
        } catch (const TimestampError& e) {
            throw RemoteError(fmt::format("Malformed Drive listing response: {}", e.what()));
        }
    } while (!pageToken.empty());

    std::ranges::sort(docs, {}, &RemoteDocument::name);
    return docs;
}

void DriveStore::fetch(const std::string& location, const fs::path& dest) {
    const auto url = fmt::format("{}/files/{}?alt=media", cfg_.drive.api_base, urlEscape(location));
    const auto hdrs = headers();

    HttpResponse resp;
    {
        FilePtr out(std::fopen(dest.c_str(), "wb"));
        if (!out) throw TransferError(fmt::format("Cannot open {} for writing", dest.string()));

        resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, static_cast<curl_write_callback>(nullptr)); // default fwrite
            curl_easy_setopt(h, CURLOPT_WRITEDATA, out.get());
            applyTimeouts(h);
        });
    }

    if (resp.ok()) return;

    // error bodies were streamed into dest
    std::error_code ec;
    if (resp.curl == CURLE_OK) {
        try {
            resp.body = readFileToString(dest);
        } catch (const Error& e) {
            log::Registry::remote()->debug("[DriveStore] Could not read error body for {}: {}", location, e.what());
        }
    }
    fs::remove(dest, ec);

    if (resp.unauthorized()) throw RemoteAuthError("Drive rejected the access token during download: " + describeFailure(resp));
    log::Registry::remote()->warn("[DriveStore] Download of {} failed: {}", location, describeFailure(resp));
    throwTransferFailure(resp, fmt::format("Failed to download {}", location));
}

std::optional<std::string> DriveStore::findFileId(const std::string& name) const {
    const auto query = fmt::format("name={} and {} in parents and trashed=false",
                                   quoteQueryLiteral(name), quoteQueryLiteral(folderId_));
    const auto url = fmt::format("{}/files?q={}&spaces=drive&fields={}",
                                 cfg_.drive.api_base, urlEscape(query), urlEscape("files(id,name)"));

    const auto resp = getJson(url);
    if (resp.unauthorized()) throw RemoteAuthError("Drive rejected the access token: " + describeFailure(resp));
    if (!resp.ok()) throwTransferFailure(resp, fmt::format("Failed to look up {}", name));

    try {
        const auto j = json::parse(resp.body);
        const auto files = j.value("files", json::array());
        if (files.empty()) return std::nullopt;
        return files.front().at("id").get<std::string>();
    } catch (const json::exception& e) {
        throw TransferError(fmt::format("Malformed Drive lookup response for {}: {}", name, e.what()));
    }
}

std::string DriveStore::createFile(const std::string& name) const {
    const json meta = {
        {"name", name},
        {"parents", json::array({folderId_})},
        {"mimeType", DOCX_MIME}
    };

    const auto resp = postJson(cfg_.drive.api_base + "/files?fields=id", meta.dump());
    if (resp.unauthorized()) throw RemoteAuthError("Drive rejected the access token: " + describeFailure(resp));
    if (!resp.ok()) throwTransferFailure(resp, fmt::format("Failed to create {}", name));

    try {
        return json::parse(resp.body).at("id").get<std::string>();
    } catch (const json::exception& e) {
        throw TransferError(fmt::format("Malformed Drive create response for {}: {}", name, e.what()));
    }
}

void DriveStore::uploadMedia(const std::string& fileId, const fs::path& src) const {
    std::error_code ec;
    const auto size = fs::file_size(src, ec);
    if (ec) throw TransferError(fmt::format("Cannot stat {}: {}", src.string(), ec.message()));

    FilePtr in(std::fopen(src.c_str(), "rb"));
    if (!in) throw TransferError(fmt::format("Cannot open {} for upload", src.string()));

    const auto url = fmt::format("{}/files/{}?uploadType=media&fields=id", cfg_.drive.upload_base, urlEscape(fileId));
    const auto hdrs = headers(DOCX_MIME);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PATCH");
        curl_easy_setopt(h, CURLOPT_READDATA, in.get()); // default fread
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        applyTimeouts(h);
    });

    if (resp.unauthorized()) throw RemoteAuthError("Drive rejected the access token during upload: " + describeFailure(resp));
    if (!resp.ok()) {
        log::Registry::remote()->warn("[DriveStore] Upload of {} failed: {}", src.filename().string(), describeFailure(resp));
        throwTransferFailure(resp, fmt::format("Failed to upload {}", src.filename().string()));
    }
}

std::string DriveStore::store(const std::string& name, const fs::path& src) {
    const auto existing = findFileId(name);
    const auto id = existing ? *existing : createFile(name);
    uploadMedia(id, src);
    log::Registry::remote()->debug("[DriveStore] Stored {} as {}", name, id);
    return id;
}

Descriptor DriveStore::findOrCreateFolder(const std::string& name) const {
    const auto query = fmt::format("name={} and mimeType='{}' and trashed=false", quoteQueryLiteral(name), FOLDER_MIME);
    const auto url = fmt::format("{}/files?q={}&spaces=drive&fields={}",
                                 cfg_.drive.api_base, urlEscape(query), urlEscape("files(id,name)"));

    const auto resp = getJson(url);
    if (resp.unauthorized()) throw RemoteAuthError("Drive rejected the access token: " + describeFailure(resp));
    if (!resp.ok()) throw RemoteError(fmt::format("Failed to look up Drive folder '{}': {}", name, describeFailure(resp)));

    Descriptor d;
    d.backend = Backend::Drive;

    try {
        const auto files = json::parse(resp.body).value("files", json::array());
        if (!files.empty()) {
            d.folder_id = files.front().at("id").get<std::string>();
            d.folder_name = files.front().at("name").get<std::string>();
            return d;
        }
    } catch (const json::exception& e) {
        throw RemoteError(fmt::format("Malformed Drive folder lookup response: {}", e.what()));
    }

    const json meta = {{"name", name}, {"mimeType", FOLDER_MIME}};
    const auto created = postJson(cfg_.drive.api_base + "/files?fields=id,name", meta.dump());
    if (created.unauthorized()) throw RemoteAuthError("Drive rejected the access token: " + describeFailure(created));
    if (!created.ok()) throw RemoteError(fmt::format("Failed to create Drive folder '{}': {}", name, describeFailure(created)));

    try {
        const auto j = json::parse(created.body);
        d.folder_id = j.at("id").get<std::string>();
        d.folder_name = j.value("name", name);
    } catch (const json::exception& e) {
        throw RemoteError(fmt::format("Malformed Drive folder create response: {}", e.what()));
    }

    log::Registry::remote()->info("[DriveStore] Created folder '{}' ({})", d.folder_name, d.folder_id);
    return d;
}
