#pragma once
#include <string>
#include <vector>
#include <utility>

namespace klaus {

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = transport failure, see error
    std::string body;
    std::string error;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Process-wide transport setup for the lifetime of the object. Create one
// in main() before any request is made.
class HttpRuntime {
public:
    HttpRuntime();
    ~HttpRuntime();

    HttpRuntime(const HttpRuntime&) = delete;
    HttpRuntime& operator=(const HttpRuntime&) = delete;
};

// Injectable client used by the embedding providers. Implementations add
// the JSON content type; callers pass only extra headers (auth).
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) = 0;
};

// Only one transport is compiled per build (CMakeLists.txt picks the source).
#ifdef __linux__

// POSIX sockets + OpenSSL
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::vector<Header>& headers,
                           long timeout_seconds) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::vector<Header>& headers,
                           long timeout_seconds) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace klaus
