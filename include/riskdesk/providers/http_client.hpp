// include/riskdesk/providers/http_client.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "riskdesk/core/error.hpp"

namespace riskdesk {

/**
 * @brief Raw HTTP response as seen by a provider
 */
struct HttpResponse {
    long status{0};
    std::string body;
    std::optional<long> retry_after_seconds;  // Parsed Retry-After header, if any
};

/**
 * @brief Transport used by quote providers
 *
 * Implementations return a Result error only when no HTTP response was
 * received at all (DNS, connect, timeout). Any status code, including 4xx and
 * 5xx, is a successful transport call and is classified by the provider.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform an HTTP GET
     * @param url Absolute URL including the query string
     * @param headers Extra request headers ("Name: value")
     * @param timeout Total request timeout
     * @return Response, or TRANSIENT_ERROR when the request could not complete
     */
    virtual Result<HttpResponse> get(const std::string& url,
                                     const std::vector<std::string>& headers,
                                     std::chrono::milliseconds timeout) = 0;
};

/**
 * @class CurlHttpClient
 * @brief libcurl-backed transport
 *
 * Every request uses its own easy handle so one client can be shared between
 * request threads.
 */
class CurlHttpClient : public HttpTransport {
public:
    /**
     * @param user_agent User-Agent header sent with each request
     */
    explicit CurlHttpClient(std::string user_agent = "riskdesk/1.0");
    ~CurlHttpClient() override = default;

    Result<HttpResponse> get(const std::string& url, const std::vector<std::string>& headers,
                             std::chrono::milliseconds timeout) override;

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* body);
    static size_t header_callback(char* buffer, size_t size, size_t nitems,
                                  HttpResponse* response);

    std::string user_agent_;
};

/**
 * @brief Percent-encode a query string component
 */
std::string url_encode(const std::string& value);

}  // namespace riskdesk
