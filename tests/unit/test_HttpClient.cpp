#include <catch2/catch_test_macros.hpp>

#include "helpers/TestHelpers.hpp"
#include "infrastructure/network/HttpClient.hpp"

using namespace hostwatch::infra;
using namespace hostwatch::test;

TEST_CASE("HttpClient URL parsing", "[HttpClient][URL]") {
    SECTION("Explicit port and path") {
        auto url = HttpClient::parseUrl("http://example.com:8080/health");

        REQUIRE(url.has_value());
        REQUIRE(url->scheme == "http");
        REQUIRE(url->host == "example.com");
        REQUIRE(url->port == 8080);
        REQUIRE(url->target == "/health");
    }

    SECTION("Default ports per scheme") {
        REQUIRE(HttpClient::parseUrl("http://example.com")->port == 80);
        REQUIRE(HttpClient::parseUrl("https://example.com")->port == 443);
    }

    SECTION("Default target is the root") {
        REQUIRE(HttpClient::parseUrl("http://example.com")->target == "/");
    }

    SECTION("Query is kept and fragment dropped") {
        REQUIRE(HttpClient::parseUrl("http://example.com/a?b=1#frag")->target == "/a?b=1");
        REQUIRE(HttpClient::parseUrl("http://example.com?b=1")->target == "/?b=1");
        REQUIRE(HttpClient::parseUrl("http://example.com#frag")->target == "/");
    }

    SECTION("Scheme is case-insensitive") {
        REQUIRE(HttpClient::parseUrl("HTTPS://example.com")->scheme == "https");
    }

    SECTION("IPv6 literal") {
        auto url = HttpClient::parseUrl("http://[::1]:9000/");

        REQUIRE(url.has_value());
        REQUIRE(url->host == "::1");
        REQUIRE(url->port == 9000);
    }

    SECTION("User info is dropped") {
        REQUIRE(HttpClient::parseUrl("http://user:pw@example.com:81/")->host == "example.com");
    }

    SECTION("Malformed URLs are rejected") {
        REQUIRE_FALSE(HttpClient::parseUrl("example.com").has_value());
        REQUIRE_FALSE(HttpClient::parseUrl("ftp://example.com").has_value());
        REQUIRE_FALSE(HttpClient::parseUrl("http://").has_value());
        REQUIRE_FALSE(HttpClient::parseUrl("http://example.com:0/").has_value());
        REQUIRE_FALSE(HttpClient::parseUrl("http://example.com:70000/").has_value());
        REQUIRE_FALSE(HttpClient::parseUrl("http://example.com:80x/").has_value());
        REQUIRE_FALSE(HttpClient::parseUrl("http://[::1/").has_value());
    }
}

TEST_CASE("HttpClient requests", "[HttpClient][Network]") {
    HttpClient client;
    const auto timeout = std::chrono::milliseconds(2000);

    SECTION("GET receives the status line") {
        LocalHttpServer server(204);

        auto response = client.get(server.url("/ping"), timeout);

        REQUIRE(response.completed);
        REQUIRE(response.success);
        REQUIRE(response.statusCode == 204);
        REQUIRE(server.requestCount() == 1);
        REQUIRE(server.requests().front().rfind("GET /ping HTTP/1.1\r\n", 0) == 0);
    }

    SECTION("Error status completes without success") {
        LocalHttpServer server(503);

        auto response = client.get(server.url(), timeout);

        REQUIRE(response.completed);
        REQUIRE_FALSE(response.success);
        REQUIRE(response.statusCode == 503);
        REQUIRE_FALSE(response.errorMessage.empty());
    }

    SECTION("Body is read") {
        LocalHttpServer server(200);

        auto response = client.get(server.url(), timeout);

        REQUIRE(response.body == "ok");
    }

    SECTION("POST sends headers and payload") {
        LocalHttpServer server(200);

        auto response = client.post(server.url("/hook"), R"({"a":1})",
                                    {{"Content-Type", "application/json"}}, timeout);

        REQUIRE(response.success);
        auto request = server.requests().front();
        REQUIRE(request.rfind("POST /hook HTTP/1.1\r\n", 0) == 0);
        REQUIRE(request.find("Content-Type: application/json\r\n") != std::string::npos);
        REQUIRE(request.find("Content-Length: 7\r\n") != std::string::npos);
        REQUIRE(request.substr(request.size() - 7) == R"({"a":1})");
    }

    SECTION("Connection refused does not complete") {
        auto response =
            client.get("http://127.0.0.1:" + std::to_string(unusedPort()) + "/", timeout);

        REQUIRE_FALSE(response.completed);
        REQUIRE_FALSE(response.errorMessage.empty());
    }

    SECTION("Silent server times out") {
        LocalHttpServer server(200, false);

        auto started = std::chrono::steady_clock::now();
        auto response = client.get(server.url(), std::chrono::milliseconds(200));
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(response.completed);
        REQUIRE(elapsed < std::chrono::seconds(2));
    }

    SECTION("https without a TLS handshake does not complete") {
        HangupServer server;
        auto url = "https://127.0.0.1:" + std::to_string(server.port()) + "/";

        auto response = client.get(url, timeout);

        REQUIRE_FALSE(response.completed);
        REQUIRE_FALSE(response.errorMessage.empty());
        REQUIRE(server.accepted() >= 1);
    }

    SECTION("https against a plain HTTP server does not complete") {
        LocalHttpServer server(200);
        auto url = "https://127.0.0.1:" + std::to_string(server.port()) + "/";

        REQUIRE_FALSE(client.get(url, std::chrono::milliseconds(300)).completed);
    }

    SECTION("Connection closed before any answer does not complete") {
        HangupServer server;
        auto url = "http://127.0.0.1:" + std::to_string(server.port()) + "/";

        REQUIRE_FALSE(client.get(url, timeout).completed);
    }

    SECTION("Invalid URL is reported") {
        auto response = client.get("not a url", timeout);

        REQUIRE_FALSE(response.completed);
        REQUIRE(response.errorMessage.find("Invalid URL") != std::string::npos);
    }
}
