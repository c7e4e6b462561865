// Blocking HTTP/1.1 POST over POSIX sockets, with OpenSSL for https URLs.
#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/select.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace costgate {

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::invalid_argument("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty())
        throw std::invalid_argument("URL has no host: " + url);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

namespace {

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const ParsedUrl& url, long timeout_secs) {
        if (!connect_tcp(url, timeout_secs)) return false;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (!url.tls) return true;

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI
        return SSL_connect(ssl_) == 1;
    }

    // >0 bytes read, 0 on EOF, -1 on error or timeout.
    ssize_t read_some(char* buf, size_t len) {
        if (ssl_) {
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl_, n);
            return err == SSL_ERROR_ZERO_RETURN ? 0 : -1;
        }
        for (;;) {
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EINTR) continue;
            return -1;
        }
    }

    bool write_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, p, static_cast<int>(left));
                if (n <= 0) return false;
            } else {
                n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool connect_tcp(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;

            // Non-blocking connect so the timeout is honoured.
            int flags = fcntl(fd_, F_GETFL, 0);
            fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd_, &wset);
                struct timeval tv{timeout_secs, 0};
                if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                    connected = (err == 0);
                }
            }
            if (connected) {
                fcntl(fd_, F_SETFL, flags);
            } else {
                ::close(fd_);
                fd_ = -1;
            }
        }
        freeaddrinfo(res);
        return connected;
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

std::string build_request(const ParsedUrl& url,
                          const std::string& body,
                          const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// The server closes after one response, so read everything and parse in memory.
std::string read_all(Connection& conn) {
    std::string out;
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

std::string dechunk(const std::string& raw) {
    std::string body;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos) break;
        // Chunk size is hex, may have extensions after ';'
        size_t chunk_size = std::strtoul(raw.c_str() + pos, nullptr, 16);
        pos = eol + 2;
        if (chunk_size == 0) break;
        if (pos + chunk_size > raw.size()) {
            body.append(raw, pos, std::string::npos);
            break;
        }
        body.append(raw, pos, chunk_size);
        pos += chunk_size + 2; // trailing \r\n
    }
    return body;
}

HttpResponse parse_response(const std::string& raw) {
    HttpResponse resp;
    size_t hdr_end = raw.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return resp;

    std::string head = raw.substr(0, hdr_end);
    std::string rest = raw.substr(hdr_end + 4);

    // "HTTP/1.1 200 OK" — extract the three-digit code
    size_t sp1 = head.find(' ');
    if (sp1 == std::string::npos || sp1 + 4 > head.size()) return resp;
    long status = std::strtol(head.c_str() + sp1 + 1, nullptr, 10);
    if (status < 100 || status > 599) return resp;

    bool chunked = false;
    size_t content_length = std::string::npos;
    size_t pos = head.find("\r\n");
    while (pos != std::string::npos && pos < head.size()) {
        size_t next = head.find("\r\n", pos + 2);
        std::string line = head.substr(pos + 2,
            next == std::string::npos ? std::string::npos : next - pos - 2);
        pos = next;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "transfer-encoding") {
            chunked = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            content_length = std::strtoul(value.c_str(), nullptr, 10);
        }
    }

    resp.status_code = status;
    if (chunked) {
        resp.body = dechunk(rest);
    } else if (content_length != std::string::npos && content_length < rest.size()) {
        resp.body = rest.substr(0, content_length);
    } else {
        resp.body = std::move(rest);
    }
    return resp;
}

} // namespace

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    ParsedUrl parsed = parse_url(url);

    Connection conn;
    if (!conn.open(parsed, timeout_seconds)) return {};
    if (!conn.write_all(build_request(parsed, body, headers))) return {};

    return parse_response(read_all(conn));
}

} // namespace costgate
