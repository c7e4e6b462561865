#include <catch2/catch.hpp>
#include "http.hpp"
#include <stdexcept>

using namespace costgate;

TEST_CASE("parse_url: https with default port", "[http]") {
    auto u = parse_url("https://api.groq.com/openai/v1/chat/completions");
    REQUIRE(u.tls);
    REQUIRE(u.host == "api.groq.com");
    REQUIRE(u.port == "443");
    REQUIRE(u.path == "/openai/v1/chat/completions");
}

TEST_CASE("parse_url: http with explicit port and query", "[http]") {
    auto u = parse_url("http://127.0.0.1:5000/api/stats?x=1");
    REQUIRE_FALSE(u.tls);
    REQUIRE(u.host == "127.0.0.1");
    REQUIRE(u.port == "5000");
    REQUIRE(u.path == "/api/stats?x=1");
}

TEST_CASE("parse_url: missing path becomes root", "[http]") {
    auto u = parse_url("http://localhost");
    REQUIRE(u.port == "80");
    REQUIRE(u.path == "/");
}

TEST_CASE("parse_url: rejects malformed URLs", "[http]") {
    REQUIRE_THROWS_AS(parse_url("api.groq.com/v1"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("ftp://host/file"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("https:///path"), std::invalid_argument);
}

TEST_CASE("SocketHttpClient: unreachable host reports status 0", "[http]") {
    SocketHttpClient client;
    // Port 1 on loopback is closed on any sane test machine.
    auto resp = client.post("http://127.0.0.1:1/", "{}", {}, 2);
    REQUIRE(resp.status_code == 0);
}
