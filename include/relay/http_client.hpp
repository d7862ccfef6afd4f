#pragma once

#include <chrono>
#include <map>
#include <string>

namespace relay {

/**
 * HTTP request options.
 */
struct HttpRequest {
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{1000};
};

/**
 * HTTP response.
 *
 * status_code is 0 when the request never produced a response (connection
 * refused, timeout, DNS failure); error describes why.
 */
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;

    bool transport_ok() const { return status_code != 0; }
    bool ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Synchronous HTTP client used to talk to a running instance.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * HttpClient backed by libcurl. Every request is bounded by its timeout.
 */
class CurlHttpClient : public HttpClient {
public:
    HttpResponse send(const HttpRequest& request) override;
};

} // namespace relay
