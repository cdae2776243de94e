#include "curl_abbreviation_lookup.h"

#include <utility>

#include <curl/curl.h>
#include <glog/logging.h>

#include "absl/strings/ascii.h"

namespace BibSane {

namespace {

size_t CurlWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

CurlAbbreviationLookup::CurlAbbreviationLookup(std::string service_prefix, long timeout_ms)
    : service_prefix_(std::move(service_prefix)),
      timeout_ms_(timeout_ms) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlAbbreviationLookup::~CurlAbbreviationLookup() {
    curl_global_cleanup();
}

std::optional<std::string> CurlAbbreviationLookup::Lookup(const std::string& journal) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG(WARNING) << "curl init failed, cannot abbreviate: " << journal;
        return std::nullopt;
    }

    char* escaped = curl_easy_escape(curl, journal.c_str(), static_cast<int>(journal.size()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        LOG(WARNING) << "Failed to escape journal name: " << journal;
        return std::nullopt;
    }
    const std::string url = service_prefix_ + escaped;
    curl_free(escaped);

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    VLOG(1) << "Downloading abbreviation for: " << journal;
    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        LOG(WARNING) << "Abbreviation lookup failed for " << journal << ": " << curl_easy_strerror(res);
        return std::nullopt;
    }
    if (http_code != 200) {
        LOG(WARNING) << "Abbreviation service returned HTTP " << http_code << " for " << journal;
        return std::nullopt;
    }
    std::string abbreviation(absl::StripAsciiWhitespace(body));
    if (abbreviation.empty()) {
        LOG(WARNING) << "Abbreviation service returned an empty answer for " << journal;
        return std::nullopt;
    }
    return abbreviation;
}

} // namespace BibSane
