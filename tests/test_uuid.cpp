#include <catch2/catch.hpp>
#include <feedstore/uuid.hpp>
#include <set>
#include <thread>
#include <vector>

using namespace feedstore;

TEST_CASE("UUID v4 version and variant bits", "[uuid]") {
    auto u = Uuid::v4();
    REQUIRE((u.bytes[6] & 0xF0) == 0x40);
    REQUIRE((u.bytes[8] & 0xC0) == 0x80);
}

TEST_CASE("UUID v4 generates unique values", "[uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto s = Uuid::v4().to_string();
        REQUIRE(seen.find(s) == seen.end());
        seen.insert(s);
    }
}

TEST_CASE("UUID to_string is canonical lowercase", "[uuid]") {
    auto parsed = Uuid::from_string("E621E1F8-C36C-495A-93FC-0C247A3E6E5F");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().to_string() == "e621e1f8-c36c-495a-93fc-0c247a3e6e5f");
}

TEST_CASE("UUID from_string roundtrip", "[uuid]") {
    auto u = Uuid::v4();
    auto parsed = Uuid::from_string(u.to_string());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value() == u);
}

TEST_CASE("UUID from_string rejects malformed text", "[uuid]") {
    SECTION("wrong length") {
        auto r = Uuid::from_string("A1");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == FeedStoreError::Parse);
    }
    SECTION("missing dashes") {
        auto r = Uuid::from_string("550e8400e29b41d4a716446655440000abcd");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == FeedStoreError::Parse);
    }
    SECTION("invalid hex") {
        auto r = Uuid::from_string("550e8400-e29b-41d4-a716-44665544gggg");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == FeedStoreError::Parse);
    }
}

TEST_CASE("UUID equality operators", "[uuid]") {
    auto a = Uuid::v4();
    auto b = a;
    REQUIRE(a == b);
    REQUIRE_FALSE(a != b);

    auto c = Uuid::v4();
    REQUIRE(a != c);
}

TEST_CASE("UUID from_string reports the offending position", "[uuid]") {
    auto dash = Uuid::from_string("550e8400-e29b-41d4xa716-446655440000");
    REQUIRE(dash.is_err());
    CHECK(dash.error().message.find("position 18") != std::string::npos);

    auto hex = Uuid::from_string("550e8400-e29b-41d4-a716-44665544000z");
    REQUIRE(hex.is_err());
    CHECK(hex.error().message.find("position 35") != std::string::npos);
}

TEST_CASE("UUID v4 is unique across threads", "[uuid]") {
    std::vector<Uuid> a, b;
    std::thread t([&b] {
        for (int i = 0; i < 50; ++i) b.push_back(Uuid::v4());
    });
    for (int i = 0; i < 50; ++i) a.push_back(Uuid::v4());
    t.join();

    std::set<std::string> seen;
    for (auto& u : a) seen.insert(u.to_string());
    for (auto& u : b) seen.insert(u.to_string());
    REQUIRE(seen.size() == 100);
}
