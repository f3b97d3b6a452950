// Linux HTTP/HTTPS transport over POSIX sockets + OpenSSL. Embedding
// requests only need a JSON POST with a fully buffered response.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

namespace klaus {

// OpenSSL 1.1+ initialises itself
HttpRuntime::HttpRuntime() {}
HttpRuntime::~HttpRuntime() {}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static bool parse_url(const std::string& url, ParsedUrl& result) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    result.tls = (url.compare(0, scheme_end, "https") == 0);

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return !result.host.empty();
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Empty string on success, otherwise what went wrong.
    std::string connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) return "cannot resolve " + url.host + ": " + gai_strerror(gai);

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so the timeout is honoured
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                if (select(fd + 1, nullptr, &wset, nullptr, &tv) > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    connected = (err == 0);
                }
            }
            if (connected) {
                fcntl(fd, F_SETFL, flags);
            } else {
                ::close(fd);
                fd = -1;
            }
        }
        freeaddrinfo(res);
        if (!connected) return "cannot connect to " + url.host + ":" + url.port;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (url.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return "SSL_CTX_new failed";
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return "SSL_new failed";
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) return "TLS handshake with " + url.host + " failed";
        }
        return {};
    }

    // Returns >0 on data, 0 on EOF, -1 on error or timeout.
    ssize_t read_some(char* buf, size_t len) {
        if (ssl) {
            int n = SSL_read(ssl, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_ZERO_RETURN) return 0;
            // Peer closed without close_notify
            if (err == SSL_ERROR_SYSCALL && n == 0 && ERR_peek_error() == 0) return 0;
            return -1;
        }
        ssize_t n = ::recv(fd, buf, len, 0);
        return n >= 0 ? n : -1;
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) return false;
            } else {
                n = ::send(fd, buf, len, 0);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }
};

// ── Request / response ─────────────────────────────────────────

static std::string build_request(const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    req += "Content-Type: application/json\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// Decode a chunked transfer-encoded body
static std::string dechunk(const std::string& raw) {
    std::string out;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos) break;
        size_t chunk_size = std::strtoul(raw.c_str() + pos, nullptr, 16);
        if (chunk_size == 0) break;
        pos = eol + 2;
        out.append(raw, pos, std::min(chunk_size, raw.size() - pos));
        pos += chunk_size + 2; // skip trailing \r\n
    }
    return out;
}

static HttpResponse parse_response(const std::string& raw) {
    HttpResponse resp;
    size_t header_end = raw.find("\r\n\r\n");
    size_t sp1 = raw.find(' ');
    if (header_end == std::string::npos || sp1 == std::string::npos || sp1 > header_end) {
        resp.error = "malformed HTTP response";
        return resp;
    }

    // Status line: "HTTP/1.1 200 OK"
    resp.status_code = std::strtol(raw.c_str() + sp1 + 1, nullptr, 10);

    std::string headers = raw.substr(0, header_end);
    for (auto& c : headers) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    bool chunked = headers.find("transfer-encoding: chunked") != std::string::npos;

    std::string body = raw.substr(header_end + 4);
    resp.body = chunked ? dechunk(body) : std::move(body);
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post_json(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         long timeout_seconds) {
    HttpResponse failed;
    ParsedUrl parsed;
    if (!parse_url(url, parsed)) {
        failed.error = "invalid URL: " + url;
        return failed;
    }

    Connection conn;
    failed.error = conn.connect(parsed, timeout_seconds);
    if (!failed.error.empty()) return failed;

    std::string request = build_request(parsed, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        failed.error = "write to " + parsed.host + " failed";
        return failed;
    }

    // Connection: close, so the body ends when the server hangs up
    std::string raw;
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n < 0) {
            failed.error = "read from " + parsed.host + " failed or timed out";
            return failed;
        }
        if (n == 0) break;
        raw.append(buf, static_cast<size_t>(n));
    }
    return parse_response(raw);
}

} // namespace klaus

#endif // __linux__
