#include <catch2/catch.hpp>
#include "http_server.hpp"
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace costgate;

// ── parse_listen_addr ───────────────────────────────────────────

TEST_CASE("parse_listen_addr: host and port", "[server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("127.0.0.1:5000", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 5000);
}

TEST_CASE("parse_listen_addr: port zero means ephemeral", "[server]") {
    std::string host;
    uint16_t port = 1;
    REQUIRE(parse_listen_addr("0.0.0.0:0", host, port));
    REQUIRE(port == 0);
}

TEST_CASE("parse_listen_addr: rejects malformed addresses", "[server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1", host, port));
    REQUIRE_FALSE(parse_listen_addr(":5000", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:http", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:65536", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:-1", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:99999999999999999999", host, port));
}

// ── ControlServer ───────────────────────────────────────────────

TEST_CASE("ControlServer: invalid listen address fails to start", "[server]") {
    ControlServer server("nowhere", 1024, [](const ApiRequest&) { return ApiResponse{}; });
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid listen address") != std::string::npos);
}

TEST_CASE("ControlServer: serves a request over loopback", "[server]") {
    ControlServer server("127.0.0.1:0", 4096, [](const ApiRequest& req) {
        ApiResponse resp;
        resp.body = nlohmann::json{
            {"method", req.method},
            {"path", req.path},
            {"body", req.body},
            {"limit", req.query_param("limit")},
            {"contentType", req.headers.count("content-type") ? req.headers.at("content-type") : ""}
        }.dump();
        return resp;
    });
    std::string error;
    REQUIRE(server.start(error));
    REQUIRE(server.port() != 0);

    SocketHttpClient client;
    std::string base = "http://127.0.0.1:" + std::to_string(server.port());
    auto resp = client.post(base + "/api/echo?limit=5&x=a%20b", R"({"k":1})",
                            {{"Content-Type", "application/json"}}, 5);

    REQUIRE(resp.status_code == 200);
    auto j = nlohmann::json::parse(resp.body);
    REQUIRE(j["method"] == "POST");
    REQUIRE(j["path"] == "/api/echo");
    REQUIRE(j["body"] == R"({"k":1})");
    REQUIRE(j["limit"] == "5");
    REQUIRE(j["contentType"] == "application/json");

    server.stop();
}

TEST_CASE("ControlServer: oversized body is rejected with 413", "[server]") {
    bool called = false;
    ControlServer server("127.0.0.1:0", 16, [&](const ApiRequest&) {
        called = true;
        return ApiResponse{};
    });
    std::string error;
    REQUIRE(server.start(error));

    SocketHttpClient client;
    auto resp = client.post("http://127.0.0.1:" + std::to_string(server.port()) + "/x",
                            std::string(64, 'a'), {}, 5);
    REQUIRE(resp.status_code == 413);
    server.stop();
    REQUIRE_FALSE(called);
}

TEST_CASE("ControlServer: handler exception becomes 500", "[server]") {
    ControlServer server("127.0.0.1:0", 1024, [](const ApiRequest&) -> ApiResponse {
        throw std::runtime_error("handler bug");
    });
    std::string error;
    REQUIRE(server.start(error));

    SocketHttpClient client;
    auto resp = client.post("http://127.0.0.1:" + std::to_string(server.port()) + "/x",
                            "{}", {}, 5);
    REQUIRE(resp.status_code == 500);
    server.stop();
}

TEST_CASE("ControlServer: stop is idempotent", "[server]") {
    ControlServer server("127.0.0.1:0", 1024, [](const ApiRequest&) { return ApiResponse{}; });
    std::string error;
    REQUIRE(server.start(error));
    server.stop();
    server.stop();
}
