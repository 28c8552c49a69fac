#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include "CorpusSink.h"

// Appends one JSON object per origin to a file (JSON Lines)
class JsonLinesCorpusSink : public CorpusSink {
public:
    // Throws std::runtime_error when the file cannot be opened for appending
    explicit JsonLinesCorpusSink(const std::string& path);

    void store(const std::string& topic, const OriginCorpus& corpus) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;
};
