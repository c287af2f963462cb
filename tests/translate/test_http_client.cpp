#include <catch2/catch_test_macros.hpp>

#include "translate/HttpClient.hpp"

using translate::HttpReply;

TEST_CASE("HttpReply classifies failures", "[translate][http]") {
    SECTION("Transport errors and server faults are transient") {
        HttpReply reply;
        reply.transport_error = "timeout";
        REQUIRE_FALSE(reply.ok());
        REQUIRE(reply.transient());

        HttpReply busy;
        busy.status = 503;
        REQUIRE(busy.transient());

        HttpReply throttled;
        throttled.status = 429;
        REQUIRE(throttled.transient());
    }

    SECTION("Client errors are final") {
        HttpReply reply;
        reply.status = 401;
        REQUIRE_FALSE(reply.transient());
        REQUIRE_FALSE(reply.ok());
    }

    SECTION("2xx is ok") {
        HttpReply reply;
        reply.status = 204;
        REQUIRE(reply.ok());
    }
}

TEST_CASE("HttpReply describes failures", "[translate][http]") {
    SECTION("Uses the message from an error body") {
        HttpReply reply;
        reply.status = 400;
        reply.body = R"({"error":{"message":"model not found"}})";
        REQUIRE(reply.describe() == "HTTP 400: model not found");
    }

    SECTION("Falls back to the raw body") {
        HttpReply reply;
        reply.status = 502;
        reply.body = "Bad Gateway";
        REQUIRE(reply.describe() == "HTTP 502: Bad Gateway");
    }

    SECTION("Network errors") {
        HttpReply reply;
        reply.transport_error = "Connection refused";
        REQUIRE(reply.describe() == "network error: Connection refused");
    }
}
