#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <mutex>
#include <string>

namespace vortex_l0 {

static size_t curl_write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
static int curl_progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return token->should_stop() ? 1 : 0;
}

// curl_global_init is not thread-safe and must run once before any easy handle
// exists. Cleanup is left to process exit so live transports never race it.
static void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            Logger::error(std::string("[HTTP] curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    });
}

CurlHttpTransport::CurlHttpTransport(int connect_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms) {
    ensure_curl_global_init();
}

CurlHttpTransport::~CurlHttpTransport() = default;

Result<HttpResponse> CurlHttpTransport::send(const HttpRequest& request,
                                             const CancellationToken& token) {
    if (token.is_cancelled()) {
        return make_cancelled_error();
    }
    if (token.deadline_passed()) {
        return make_timeout_error();
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        Logger::warn("[HTTP] Failed to init curl");
        return make_network_error("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string line = key + ": " + value;
        headers = curl_slist_append(headers, line.c_str());
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
    if (token.has_deadline()) {
        // Never pass 0: libcurl treats it as "no timeout"
        long remaining = static_cast<long>(token.remaining_ms());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, remaining > 0 ? remaining : 1L);
    }
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curl_progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(&token));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    LOG_HTTP(request.method + " " + request.url);
    if (!request.body.empty()) {
        LOG_HTTP("Body: " + request.body);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_timeout_error();
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        if (token.is_cancelled()) {
            return make_cancelled_error();
        }
        return make_timeout_error();
    }
    if (res != CURLE_OK) {
        std::string msg = curl_easy_strerror(res);
        Logger::warn("[HTTP] curl error: " + msg);
        return make_network_error(msg);
    }

    LOG_HTTP("HTTP " + std::to_string(http_code) + " (" + std::to_string(response_body.size()) + " bytes)");

    HttpResponse response;
    response.status = static_cast<int>(http_code);
    response.body = std::move(response_body);
    return response;
}

} // namespace vortex_l0
