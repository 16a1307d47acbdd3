#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"
#include <unordered_set>

using namespace tally;

TEST_CASE("Uuid generation and formatting", "[types]") {
    auto id = Uuid::generate();

    REQUIRE_FALSE(id.is_nil());
    REQUIRE(Uuid{}.is_nil());

    const auto text = id.to_string();
    REQUIRE(text.size() == 36);
    REQUIRE(text[8] == '-');
    REQUIRE(text[14] == '4');  // Version 4

    SECTION("parse accepts its own output") {
        auto parsed = Uuid::parse(text);
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == id);
    }

    SECTION("parse accepts upper case and bare hex") {
        auto upper = Uuid::parse("0123456789ABCDEF0123456789ABCDEF");
        REQUIRE(upper.has_value());
        REQUIRE(upper->to_string() == "01234567-89ab-cdef-0123-456789abcdef");
    }

    SECTION("parse rejects malformed input") {
        REQUIRE_FALSE(Uuid::parse("").has_value());
        REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
        REQUIRE_FALSE(Uuid::parse(text + "00").has_value());
        REQUIRE_FALSE(Uuid::parse(text.substr(0, 35)).has_value());
    }
}

TEST_CASE("Uuid values are unique and hashable", "[types]") {
    std::unordered_set<Uuid> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(Uuid::generate());
    }
    REQUIRE(ids.size() == 1000);
}

TEST_CASE("Timestamp arithmetic and formatting", "[types]") {
    const Timestamp t(1'700'000'000'123);

    REQUIRE((t + std::chrono::milliseconds(877)).millis() == 1'700'000'001'000);
    REQUIRE((Timestamp(5000) - Timestamp(2000)).count() == 3000);
    REQUIRE(Timestamp{}.is_epoch());
    REQUIRE(t.to_iso_string() == "2023-11-14T22:13:20.123Z");
    REQUIRE(Timestamp(1000) < Timestamp(2000));
}
