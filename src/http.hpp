#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace bankmatch {

// Process-wide libcurl setup; call once before any thread issues requests.
void http_init();
void http_cleanup();

// In-flight requests abort within about a second once *flag becomes true.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;
};

// Blocking POST over libcurl. Safe to share between threads: every call
// uses its own easy handle.
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};

} // namespace bankmatch
