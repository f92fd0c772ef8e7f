#include "http.hpp"
#include <curl/curl.h>
#include <iostream>

namespace bankmatch {

static const std::atomic<bool>* g_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

// curl polls this about once a second; non-zero aborts the transfer
static int on_progress(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return (g_abort_flag && g_abort_flag->load(std::memory_order_relaxed)) ? 1 : 0;
}

static size_t on_body(char* data, size_t size, size_t nmemb, void* out) {
    static_cast<std::string*>(out)->append(data, size * nmemb);
    return size * nmemb;
}

namespace {

// Easy handle plus header list, released together
struct CurlHandle {
    CURL* curl = curl_easy_init();
    curl_slist* headers = nullptr;

    CurlHandle() = default;
    ~CurlHandle() {
        curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

} // namespace

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    CurlHandle h;
    if (!h.curl) {
        std::cerr << "[http] curl_easy_init failed\n";
        return {};
    }
    for (const auto& hdr : headers) {
        h.headers = curl_slist_append(h.headers, (hdr.first + ": " + hdr.second).c_str());
    }

    HttpResponse response;
    curl_easy_setopt(h.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
    curl_easy_setopt(h.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(h.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(h.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &response.body);
    if (g_abort_flag) {
        curl_easy_setopt(h.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h.curl, CURLOPT_XFERINFOFUNCTION, on_progress);
    }

    CURLcode rc = curl_easy_perform(h.curl);
    if (rc != CURLE_OK) {
        std::cerr << "[http] POST " << url << " failed: " << curl_easy_strerror(rc) << "\n";
        return {};
    }
    curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace bankmatch
