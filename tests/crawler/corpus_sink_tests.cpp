#include <catch2/catch_test_macros.hpp>
#include "JsonLinesCorpusSink.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

std::vector<nlohmann::json> readLines(const std::string& path) {
    std::vector<nlohmann::json> records;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        records.push_back(nlohmann::json::parse(line));
    }
    return records;
}

std::string tempPath(const std::string& name) {
    return "/tmp/topic_harvest_" + name + ".jsonl";
}

} // namespace

TEST_CASE("JsonLinesCorpusSink appends one record per origin", "[CorpusSink]") {
    const std::string path = tempPath("sink_records");
    std::remove(path.c_str());

    OriginCorpus first;
    first.origin = "https://a.example";
    first.text = "Solar one\n\nSolar two";
    first.wordCount = 4;
    first.pagesFetched = 2;
    first.finalState = CrawlState::COMPLETED;

    OriginCorpus second;
    second.origin = "https://b.example";
    second.finalState = CrawlState::EXHAUSTED;

    {
        JsonLinesCorpusSink sink(path);
        sink.store("solar", first);
        sink.store("solar", second);
    }

    auto records = readLines(path);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0]["topic"] == "solar");
    REQUIRE(records[0]["origin"] == "https://a.example");
    REQUIRE(records[0]["text"] == "Solar one\n\nSolar two");
    REQUIRE(records[0]["word_count"] == 4);
    REQUIRE(records[0]["pages_fetched"] == 2);
    REQUIRE(records[0]["state"] == "completed");
    REQUIRE(records[1]["state"] == "exhausted");
    REQUIRE(records[1]["text"] == "");

    SECTION("A second sink on the same file appends") {
        {
            JsonLinesCorpusSink again(path);
            again.store("wind", second);
        }
        auto appended = readLines(path);
        REQUIRE(appended.size() == 3);
        REQUIRE(appended[2]["topic"] == "wind");
    }

    std::remove(path.c_str());
}

TEST_CASE("JsonLinesCorpusSink survives invalid UTF-8 in page text", "[CorpusSink]") {
    const std::string path = tempPath("sink_utf8");
    std::remove(path.c_str());

    OriginCorpus corpus;
    corpus.origin = "https://a.example";
    corpus.text = std::string("caf\xE9 solar");

    {
        JsonLinesCorpusSink sink(path);
        REQUIRE_NOTHROW(sink.store("solar", corpus));
    }
    REQUIRE(readLines(path).size() == 1);
    std::remove(path.c_str());
}

TEST_CASE("JsonLinesCorpusSink reports unwritable paths", "[CorpusSink]") {
    REQUIRE_THROWS_AS(JsonLinesCorpusSink("/nonexistent-dir/corpus.jsonl"), std::runtime_error);
}
