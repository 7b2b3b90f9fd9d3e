#include "keyward/channel/curl_http_transport.hpp"
#include "keyward/core/format.hpp"
#include "keyward/debug/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace keyward::channel {

using interfaces::HttpResponse;

namespace {
    constexpr std::string_view kComponent = "http";
    constexpr size_t kMaxResponseBytes = 1024 * 1024;

    struct CurlEasyDeleter {
        void operator()(CURL* handle) const noexcept {
            curl_easy_cleanup(handle);
        }
    };
    using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

    std::once_flag curl_init_flag;
    CURLcode curl_init_code = CURLE_OK;

    size_t CollectBody(char* data, const size_t size, const size_t nmemb, void* userp) {
        auto* body = static_cast<std::string*>(userp);
        const size_t bytes = size * nmemb;
        if (body->size() + bytes > kMaxResponseBytes) {
            return 0;
        }
        body->append(data, bytes);
        return bytes;
    }
}

CurlHttpTransport::CurlHttpTransport() {
    std::call_once(curl_init_flag, [] {
        curl_init_code = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

Result<HttpResponse, KeywardFailure> CurlHttpTransport::Get(
    const std::string& url,
    const std::chrono::milliseconds timeout) {
    if (curl_init_code != CURLE_OK) {
        return Result<HttpResponse, KeywardFailure>::Err(KeywardFailure::Network(
            compat::format("libcurl initialization failed: {}", curl_easy_strerror(curl_init_code))));
    }
    CurlEasyPtr handle(curl_easy_init());
    if (!handle) {
        return Result<HttpResponse, KeywardFailure>::Err(
            KeywardFailure::Network("Failed to create a libcurl handle"));
    }

    HttpResponse response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(handle.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, CollectBody);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);

    const CURLcode rc = curl_easy_perform(handle.get());
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        KEYWARD_LOG_WARN(kComponent, "GET {} timed out after {} ms", url, timeout.count());
        return Result<HttpResponse, KeywardFailure>::Err(KeywardFailure::FetchTimeout(
            compat::format("GET {} timed out after {} ms", url, timeout.count())));
    }
    if (rc != CURLE_OK) {
        KEYWARD_LOG_WARN(kComponent, "GET {} failed: {}", url, curl_easy_strerror(rc));
        return Result<HttpResponse, KeywardFailure>::Err(KeywardFailure::Network(
            compat::format("GET {} failed: {}", url, curl_easy_strerror(rc))));
    }
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    KEYWARD_LOG_DEBUG(kComponent, "GET {} -> {}", url, response.status_code);
    return Result<HttpResponse, KeywardFailure>::Ok(std::move(response));
}

} // namespace keyward::channel
