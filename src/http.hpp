#pragma once
#include <string>
#include <vector>
#include <utility>

namespace costgate {

using Header = std::pair<std::string, std::string>;

// status_code 0 means the transfer itself failed (DNS, connect, TLS, I/O).
struct HttpResponse {
    long status_code = 0;
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

// POSIX sockets + OpenSSL. Each call opens a fresh connection
// ("Connection: close"), so one instance is safe to share across threads.
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};

// Split "scheme://host[:port]/path" into its parts. Throws std::invalid_argument.
struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

ParsedUrl parse_url(const std::string& url);

} // namespace costgate
