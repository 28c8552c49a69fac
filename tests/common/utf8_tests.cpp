#include <catch2/catch_test_macros.hpp>
#include "../../include/topic_harvest/common/Utf8.h"

using namespace topic_harvest::common;

TEST_CASE("foldCase lower-cases letters across scripts", "[Utf8]") {
    SECTION("ASCII") {
        REQUIRE(foldCase("Solar PANELS 42") == "solar panels 42");
    }

    SECTION("Latin-1 Supplement keeps the multiplication sign") {
        REQUIRE(foldCase("\xC3\x89T\xC3\x89 \xC3\x97 \xC3\x9C") == "\xC3\xA9t\xC3\xA9 \xC3\x97 \xC3\xBC");
    }

    SECTION("Latin Extended-A") {
        // Ł Ź Ÿ -> ł ź ÿ
        REQUIRE(foldCase("\xC5\x81\xC5\xB9\xC5\xB8") == "\xC5\x82\xC5\xBA\xC3\xBF");
    }

    SECTION("Greek with and without tonos") {
        // ΆΛΦΑ -> άλφα
        REQUIRE(foldCase("\xCE\x86\xCE\x9B\xCE\xA6\xCE\x91") == "\xCE\xAC\xCE\xBB\xCF\x86\xCE\xB1");
    }

    SECTION("Cyrillic including Ё") {
        // ЁЖ -> ёж
        REQUIRE(foldCase("\xD0\x81\xD0\x96") == "\xD1\x91\xD0\xB6");
    }

    SECTION("Other scripts and malformed bytes pass through") {
        const std::string mixed = "\xE6\x97\xA5\xE6\x9C\xAC \xFF\xC3";
        REQUIRE(foldCase(mixed) == mixed);
    }
}

TEST_CASE("decodeUtf8 reports sequence lengths", "[Utf8]") {
    uint32_t cp = 0;
    REQUIRE(decodeUtf8("a", 0, cp) == 1);
    REQUIRE(cp == 'a');

    REQUIRE(decodeUtf8("\xE2\x80\x8B", 0, cp) == 3);
    REQUIRE(cp == 0x200B);

    REQUIRE(decodeUtf8("\xE2\x80", 0, cp) == 0);
    REQUIRE(decodeUtf8("\xC3x", 0, cp) == 0);

    std::string out;
    appendUtf8(out, 0x1F600);
    REQUIRE(out == "\xF0\x9F\x98\x80");
}
