#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "noexpp/json/fast_json.hpp"

#include <cstdint>
#include <string>

using namespace noexpp;
using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Frame-shaped documents
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("fast_parse reads a welcome frame", "[json][simdjson]") {
    auto result = fast_parse(R"({"type":"welcome","version":"1.0.0","serverTime":1700000000000,"requiresAuth":true})");

    REQUIRE(result.has_value());
    CHECK((*result)["type"] == "welcome");
    CHECK((*result)["serverTime"].is_number_integer());
    CHECK((*result)["serverTime"].get<std::int64_t>() == 1700000000000);
    CHECK((*result)["requiresAuth"] == true);
}

TEST_CASE("fast_parse keeps correlation ids integral", "[json][simdjson]") {
    auto result = fast_parse(R"({"id":18446744073709551615,"type":"result","data":null})");

    REQUIRE(result.has_value());
    CHECK((*result)["id"].is_number_unsigned());
    CHECK((*result)["id"].get<std::uint64_t>() == 18446744073709551615ULL);
    CHECK((*result)["data"].is_null());
}

TEST_CASE("fast_parse reads nested push data", "[json][simdjson]") {
    auto result = fast_parse(R"({
        "type": "push",
        "subscriptionId": "sub-1",
        "channel": "users",
        "data": [
            {"id": 1, "name": "Ann", "score": 9.5, "active": true, "tags": ["a", "b"]},
            {"id": 2, "name": "Bož", "score": -1, "active": false, "tags": []}
        ]
    })");

    REQUIRE(result.has_value());
    const auto& rows = (*result)["data"];
    REQUIRE(rows.size() == 2);
    CHECK(rows[0]["name"] == "Ann");
    CHECK_THAT(rows[0]["score"].get<double>(), Catch::Matchers::WithinRel(9.5, 0.0001));
    CHECK(rows[0]["tags"] == Json::array({"a", "b"}));
    CHECK(rows[1]["name"] == "Bo\xC5\xBE");
    CHECK(rows[1]["score"] == -1);
    CHECK(rows[1]["tags"].empty());
}

TEST_CASE("fast_parse agrees with nlohmann on escapes", "[json][simdjson]") {
    const std::string text = R"({"message":"line\nbreak \"quoted\" \\ tab\t"})";
    auto fast = fast_parse(text);

    REQUIRE(fast.has_value());
    CHECK(*fast == Json::parse(text));
}

// ─────────────────────────────────────────────────────────────────────────────
// Rejections
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("fast_parse rejects malformed input", "[json][simdjson]") {
    CHECK_FALSE(fast_parse(R"({"type": "ping",)").has_value());
    CHECK_FALSE(fast_parse(R"({type: "ping"})").has_value());
    CHECK_FALSE(fast_parse("").has_value());

    auto error = fast_parse("{not json");
    REQUIRE_FALSE(error.has_value());
    CHECK_FALSE(error.error().message.empty());
}

TEST_CASE("fast_parse rejects trailing content", "[json][simdjson]") {
    CHECK_FALSE(fast_parse(R"({"a":1} {"b":2})").has_value());
}

TEST_CASE("FastJsonParser enforces the nesting limit", "[json][simdjson]") {
    FastJsonParser parser(FastJsonConfig{2, 0});

    CHECK(parser.parse(R"({"a":{"b":1}})").has_value());

    auto too_deep = parser.parse(R"({"a":{"b":{"c":1}}})");
    REQUIRE_FALSE(too_deep.has_value());
    CHECK(too_deep.error().message.find("depth") != std::string::npos);
}

TEST_CASE("FastJsonParser enforces the document size limit", "[json][simdjson]") {
    FastJsonParser parser(FastJsonConfig{64, 16});

    CHECK(parser.parse(R"({"a":1})").has_value());

    auto too_big = parser.parse(R"({"payload":"0123456789"})");
    REQUIRE_FALSE(too_big.has_value());
    CHECK(too_big.error().message.find("exceeds limit") != std::string::npos);
}

TEST_CASE("FastJsonParser is reusable across documents", "[json][simdjson]") {
    FastJsonParser parser;

    for (int i = 0; i < 100; ++i) {
        auto result = parser.parse(R"({"id":)" + std::to_string(i) + R"(,"type":"result","data":{}})");
        REQUIRE(result.has_value());
        CHECK((*result)["id"] == i);
    }
}

TEST_CASE("fast_json_implementation names a kernel", "[json][simdjson]") {
    CHECK_FALSE(fast_json_implementation().empty());
}
