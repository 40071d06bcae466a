#pragma once

#include "cancellation.h"
#include "errors.h"
#include <string>
#include <vector>
#include <utility>

namespace vortex_l0 {

struct HttpRequest {
    std::string method = "GET";   ///< GET, POST, PUT, DELETE
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Abstract HTTP transport
 *
 * A transport returns any HTTP status as a value; only failures to get a
 * response at all (network, timeout, cancellation) come back as an Error.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one request
     * @param request Method, URL, headers, body
     * @param token Cancellation/deadline for this call
     * @return Response (any status) or Error (NetworkError, Timeout, Cancelled)
     */
    virtual Result<HttpResponse> send(const HttpRequest& request,
                                      const CancellationToken& token) = 0;
};

/**
 * @brief libcurl-backed transport
 *
 * The token's deadline becomes CURLOPT_TIMEOUT_MS, and a transfer-progress
 * callback aborts the transfer as soon as the token is cancelled.
 */
class CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(int connect_timeout_ms = 5000);
    ~CurlHttpTransport() override;

    // Non-copyable
    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    Result<HttpResponse> send(const HttpRequest& request,
                              const CancellationToken& token) override;

private:
    int connect_timeout_ms_;
};

} // namespace vortex_l0
