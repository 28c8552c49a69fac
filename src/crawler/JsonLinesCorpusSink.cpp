#include "JsonLinesCorpusSink.h"
#include "../../include/Logger.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

JsonLinesCorpusSink::JsonLinesCorpusSink(const std::string& path)
    : path_(path) {
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("Cannot open corpus output file: " + path_);
    }
    LOG_DEBUG("Writing corpus records to " + path_);
}

void JsonLinesCorpusSink::store(const std::string& topic, const OriginCorpus& corpus) {
    json record = {
        {"topic", topic},
        {"origin", corpus.origin},
        {"text", corpus.text},
        {"word_count", corpus.wordCount},
        {"pages_fetched", corpus.pagesFetched},
        {"state", crawlStateName(corpus.finalState)}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    // Invalid UTF-8 from a page must not abort the write
    out_ << record.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write corpus record to " + path_);
    }
    LOG_INFO("Stored " + std::to_string(corpus.wordCount) + " words from " + corpus.origin + " in " + path_);
}
