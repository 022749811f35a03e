#include "response/AlertChannel.hpp"
#include "core/Logger.hpp"
#include <curl/curl.h>
#include <mutex>

namespace ward {

namespace {

std::once_flag g_curl_init_flag;

size_t DiscardResponse(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

} // namespace

CurlWebhookChannel::CurlWebhookChannel(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
    std::call_once(g_curl_init_flag, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

// curl_global_cleanup is left to process exit; other channels may still be live.
CurlWebhookChannel::~CurlWebhookChannel() = default;

bool CurlWebhookChannel::Send(const std::string& payload) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR("Failed to initialize curl handle for alert to {}", endpoint_);
        return false;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, DiscardResponse);

    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        LOG_WARN("Alert delivery to {} failed: {}", endpoint_, curl_easy_strerror(rc));
        return false;
    }
    if (status < 200 || status >= 300) {
        LOG_WARN("Alert endpoint {} answered HTTP {}", endpoint_, status);
        return false;
    }
    return true;
}

} // namespace ward
