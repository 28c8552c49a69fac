#include <catch2/catch_test_macros.hpp>
#include "TopicRelevanceFilter.h"

TEST_CASE("TopicRelevanceFilter keeps paragraphs mentioning the topic", "[TopicRelevanceFilter]") {
    TopicRelevanceFilter filter("Solar");

    SECTION("Case-insensitive substring match") {
        const std::string text = "SOLAR panels are cheap\nWind is variable\n\nsolar farms grow";
        REQUIRE(filter.filterText(text) == "SOLAR panels are cheap\nsolar farms grow");
    }

    SECTION("Substrings inside longer words count") {
        REQUIRE(filter.filterText("Photovoltaic (nonsolaric) cells\nnothing") == "Photovoltaic (nonsolaric) cells");
    }

    SECTION("No match keeps the whole text") {
        const std::string text = "Wind turbines\nHydro dams";
        REQUIRE(filter.filterText(text) == text);
    }

    SECTION("Empty text stays empty") {
        REQUIRE(filter.filterText("").empty());
    }
}

TEST_CASE("TopicRelevanceFilter selects links by anchor text or href", "[TopicRelevanceFilter]") {
    TopicRelevanceFilter filter("solar");
    std::vector<ExtractedLink> links = {
        {"https://a.com/x", "Solar basics", "/x"},
        {"https://a.com/solar-faq", "FAQ", "/solar-faq"},
        {"https://a.com/wind", "Wind", "/wind"},
        {"https://a.com/y", "", "/y?topic=SOLAR"}
    };

    auto kept = filter.filterLinks(links);
    REQUIRE(kept.size() == 3);
    REQUIRE(kept[0].url == "https://a.com/x");
    REQUIRE(kept[1].url == "https://a.com/solar-faq");
    REQUIRE(kept[2].url == "https://a.com/y");
}

TEST_CASE("TopicRelevanceFilter near-duplicate detection", "[TopicRelevanceFilter]") {
    REQUIRE(TopicRelevanceFilter::isNearDuplicate("The quick brown fox", "the QUICK brown fox"));
    REQUIRE_FALSE(TopicRelevanceFilter::isNearDuplicate("The quick brown fox", "A slow green turtle"));
    // 4 shared of 5 distinct words is exactly 0.8, which is not above the threshold
    REQUIRE_FALSE(TopicRelevanceFilter::isNearDuplicate("a b c d", "a b c d e"));
    REQUIRE(TopicRelevanceFilter::isNearDuplicate("a b c d", "a b c d e", 0.7));
    REQUIRE(TopicRelevanceFilter::isNearDuplicate("", "  "));

    auto paragraphs = TopicRelevanceFilter::splitParagraphs("one\n\n  \ntwo\nthree");
    REQUIRE(paragraphs == std::vector<std::string>{"one", "two", "three"});
}

TEST_CASE("TopicRelevanceFilter folds accented and non-Latin capitals", "[TopicRelevanceFilter]") {
    SECTION("Accented topic matches lower-case text") {
        TopicRelevanceFilter filter("\xC3\x89nergie");   // "Énergie"
        const std::string text = "Boilerplate cookie notice\nL'\xC3\xA9nergie solaire progresse.";
        REQUIRE(filter.filterText(text) == "L'\xC3\xA9nergie solaire progresse.");

        std::vector<ExtractedLink> links = {{"https://a.fr/x", "\xC3\xA9nergie renouvelable", "/x"}};
        REQUIRE(filter.filterLinks(links).size() == 1);
    }

    SECTION("Cyrillic topic matches upper-case text") {
        TopicRelevanceFilter filter("\xD1\x81\xD0\xBE\xD0\xBB\xD0\xBD\xD1\x86\xD0\xB5");   // "солнце"
        REQUIRE(filter.mentionsTopic("\xD0\xA1\xD0\x9E\xD0\x9B\xD0\x9D\xD0\xA6\xD0\x95 \xD0\xB8 \xD0\xB2\xD0\xB5\xD1\x82\xD0\xB5\xD1\x80"));
    }
}
