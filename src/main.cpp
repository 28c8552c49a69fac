#include "../include/Logger.h"
#include "../include/topic_harvest/crawler/BrowserlessClient.h"
#include "crawler/ConfigLoader.h"
#include "crawler/FetchStrategyChain.h"
#include "crawler/HarvestEngine.h"
#include "crawler/JsonLinesCorpusSink.h"
#include "crawler/PageFetcher.h"

#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <memory>
#include <unistd.h>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr size_t kSnippetChars = 2000;

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        backtrace_symbols_fd(array, size, STDERR_FILENO);
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

json summarize(const HarvestResult& result) {
    json origins = json::array();
    for (const auto& corpus : result.origins) {
        origins.push_back({
            {"origin", corpus.origin},
            {"word_count", corpus.wordCount},
            {"pages_fetched", corpus.pagesFetched},
            {"state", crawlStateName(corpus.finalState)}
        });
    }

    return {
        {"topic", result.topic},
        {"word_count", result.wordCount},
        {"pages_crawled", result.pagesCrawled},
        {"state", crawlStateName(result.finalState)},
        {"origins", origins},
        {"extracted_text", result.corpus}
    };
}

} // namespace

int main(int argc, char* argv[]) {
    installCrashHandler();

    cxxopts::Options options("harvest_cli", "Collect on-topic text from the web starting at seed URLs");
    options.add_options()
        ("max-depth", "Maximum link distance from a seed", cxxopts::value<size_t>())
        ("max-pages", "Total page fetch budget", cxxopts::value<size_t>())
        ("per-origin-cap", "Page fetch budget per origin", cxxopts::value<size_t>())
        ("browserless", "Browserless base URL", cxxopts::value<std::string>())
        ("proxy", "Proxy URL for direct and archive fetches", cxxopts::value<std::string>())
        ("no-render", "Skip the headless render fallback")
        ("no-archive", "Skip the archived snapshot fallback")
        ("o,output", "Append per-origin JSON lines to this file", cxxopts::value<std::string>())
        ("log-level", "trace, debug, info, warn, error or none", cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>()->default_value(""))
        ("h,help", "Print usage")
        ("topic", "Topic to harvest", cxxopts::value<std::string>())
        ("urls", "Seed URLs", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"topic", "urls"});
    options.positional_help("<topic> <url>...");

    CrawlConfig config;
    std::string topic;
    std::vector<std::string> seeds;
    std::string outputPath;

    try {
        auto args = options.parse(argc, argv);
        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (!args.count("topic") || !args.count("urls")) {
            std::cerr << options.help() << std::endl;
            return 1;
        }

        Logger::getInstance().init(parseLogLevel(args["log-level"].as<std::string>()), true,
                                   args["log-file"].as<std::string>());

        topic = args["topic"].as<std::string>();
        seeds = args["urls"].as<std::vector<std::string>>();

        config = loadConfigFromEnvironment();
        if (args.count("max-depth")) config.maxDepth = args["max-depth"].as<size_t>();
        if (args.count("max-pages")) config.maxPages = args["max-pages"].as<size_t>();
        if (args.count("per-origin-cap")) config.perOriginCap = args["per-origin-cap"].as<size_t>();
        if (args.count("browserless")) config.browserlessUrl = args["browserless"].as<std::string>();
        if (args.count("proxy")) config.proxy = args["proxy"].as<std::string>();
        if (args.count("no-render")) config.renderingEnabled = false;
        if (args.count("no-archive")) config.archiveFallbackEnabled = false;
        if (args.count("output")) outputPath = args["output"].as<std::string>();

        validateConfig(config);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "harvest_cli: " << e.what() << "\n" << options.help() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "harvest_cli: invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    try {
        PageFetcher fetcher(config.connectTimeout, config.followRedirects, config.maxRedirects);
        fetcher.setVerifySSL(config.verifySSL);
        fetcher.setProxy(config.proxy);

        std::unique_ptr<BrowserlessClient> renderer;
        if (config.renderingEnabled) {
            renderer = std::make_unique<BrowserlessClient>(config.browserlessUrl);
            if (!renderer->isAvailable()) {
                LOG_WARNING("Browserless at " + config.browserlessUrl + " did not answer its health check; render attempts may fail");
            }
        }

        HarvestEngine engine(config, FetchStrategyChain::createDefault(config, fetcher, renderer.get()));
        if (!outputPath.empty()) {
            engine.setCorpusSink(std::make_shared<JsonLinesCorpusSink>(outputPath));
        }

        HarvestResult result = engine.crawl(topic, seeds);

        std::cout << "--- extracted text (" << result.wordCount << " words) ---\n";
        if (result.corpus.size() > kSnippetChars) {
            std::cout << result.corpus.substr(0, kSnippetChars) << "...\n";
        } else {
            std::cout << result.corpus << "\n";
        }
        std::cout << summarize(result).dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    } catch (const NetworkUnavailableError& e) {
        LOG_ERROR(std::string("Network unavailable: ") + e.what());
        std::cerr << "harvest_cli: network unavailable: " << e.what() << std::endl;
        return 2;
    } catch (const std::runtime_error& e) {
        LOG_ERROR(std::string("Harvest failed: ") + e.what());
        std::cerr << "harvest_cli: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
