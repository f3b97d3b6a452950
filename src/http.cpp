// libcurl transport for non-Linux builds. Linux uses http_socket.cpp.
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace klaus {

HttpRuntime::HttpRuntime() {
    curl_global_init(CURL_GLOBAL_ALL);
}

HttpRuntime::~HttpRuntime() {
    curl_global_cleanup();
}

static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Easy handle and header list, released together
struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void add_header(const std::string& name, const std::string& value) {
        hlist = curl_slist_append(hlist, (name + ": " + value).c_str());
    }
};

HttpResponse CurlHttpClient::post_json(const std::string& url,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req.curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    req.add_header("Content-Type", "application/json");
    for (const auto& h : headers) req.add_header(h.first, h.second);

    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(req.curl);
    if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
        response.body.clear();
        return response;
    }
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace klaus

#endif // !__linux__
