// actflow/runtime/http_client.h
#ifndef ACTFLOW_RUNTIME_HTTP_CLIENT_H
#define ACTFLOW_RUNTIME_HTTP_CLIENT_H

#include "actflow/core/types.h"
#include <chrono>
#include <stdexcept>
#include <string>

namespace actflow {

// Transport-level failure: connection refused, timeout, non-2xx status
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, long status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    long status_code() const noexcept { return status_code_; }

private:
    long status_code_;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
    // Parsed body; throws HttpError if it is not JSON
    Value json() const;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Both throw HttpError when no response could be obtained within `timeout`.
    // Non-2xx responses are returned, not thrown.
    virtual HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) = 0;
    virtual HttpResponse post_json(const std::string& url, const Value& body,
                                   std::chrono::milliseconds timeout) = 0;
};

// libcurl implementation, one easy handle per request
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) override;
    HttpResponse post_json(const std::string& url, const Value& body,
                           std::chrono::milliseconds timeout) override;

private:
    HttpResponse perform(const std::string& url, const std::string* body,
                         std::chrono::milliseconds timeout);
};

} // namespace actflow

#endif // ACTFLOW_RUNTIME_HTTP_CLIENT_H
