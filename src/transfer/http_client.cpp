#include "relay/http_client.hpp"

#include "curl_support.hpp"

namespace relay {

namespace {

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    body->append(ptr, total);
    return total;
}

} // namespace

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    HttpResponse response;

    detail::ensure_curl_initialized();

    detail::CurlHandle curl;
    if (!curl) {
        response.error = "failed to initialize CURL";
        return response;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    long timeout_ms = static_cast<long>(request.timeout.count());

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    // Instances listen on loopback; a system proxy must not intercept them
    curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "relay-launcher/" RELAY_VERSION);

    detail::CurlHeaders headers;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        headers.append(header.c_str());
    }
    if (headers.get()) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        response.body.clear();
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace relay
