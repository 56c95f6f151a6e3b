#include "util/curlWrappers.hpp"

#include <mutex>

namespace mds::util {

void ensureCurlGlobalInit() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    });
}

std::string urlEscape(const std::string_view s) {
    CurlEasy h;
    char* escaped = curl_easy_escape(h, s.data(), static_cast<int>(s.size()));
    if (!escaped) throw std::runtime_error("curl_easy_escape failed");
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

}
