#pragma once

#include <curl/curl.h>

namespace relay {
namespace detail {

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a curl header list
class CurlHeaders {
public:
    CurlHeaders() = default;
    ~CurlHeaders() { if (list_) curl_slist_free_all(list_); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void append(const char* header) { list_ = curl_slist_append(list_, header); }
    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Global curl initialization, once per process
inline void ensure_curl_initialized() {
    struct CurlGlobalInit {
        CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
        ~CurlGlobalInit() { curl_global_cleanup(); }
    };
    static CurlGlobalInit init;
}

} // namespace detail
} // namespace relay
