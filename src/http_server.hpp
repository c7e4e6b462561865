#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <cstdint>

namespace costgate {

// A parsed inbound HTTP request.
struct ApiRequest {
    std::string method;   // "GET" or "POST"
    std::string path;     // e.g. "/api/thread-stats"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

struct ApiResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Minimal HTTP/1.1 server for the control API. Meant for localhost or a
// reverse proxy in front of it. The accept loop runs in a background thread
// and each connection is served on its own short-lived thread, up to
// max_connections at once; beyond that new connections get 503.
class ControlServer {
public:
    using Handler = std::function<ApiResponse(const ApiRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:5000". Port 0 binds an
    //              ephemeral port, see port().
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    ControlServer(std::string listen_addr, uint32_t max_body, Handler handler,
                  uint32_t max_connections = 64);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, then wait for in-progress connections to finish.
    void stop();

    // Bound port, valid after a successful start().
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void dispatch(int client_fd);
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;
    uint32_t    max_connections_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    uint32_t active_connections_ = 0;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

} // namespace costgate
