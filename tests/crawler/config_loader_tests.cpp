#include <catch2/catch_test_macros.hpp>
#include "ConfigLoader.h"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Sets environment variables for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv& set(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        names_.push_back(name);
        return *this;
    }

    ~ScopedEnv() {
        for (const auto& name : names_) {
            unsetenv(name.c_str());
        }
    }

private:
    std::vector<std::string> names_;
};

} // namespace

TEST_CASE("loadConfigFromEnvironment applies overrides", "[ConfigLoader]") {
    SECTION("Defaults survive an empty environment") {
        CrawlConfig config = loadConfigFromEnvironment();
        REQUIRE(config.maxDepth == 2);
        REQUIRE(config.maxPages == 20);
        REQUIRE(config.perOriginCap == 5);
        REQUIRE(config.renderingEnabled);
        REQUIRE(config.archiveFallbackEnabled);
    }

    SECTION("Numeric, flag and string variables") {
        ScopedEnv env;
        env.set("HARVEST_MAX_DEPTH", "4")
           .set("HARVEST_MAX_PAGES", "50")
           .set("HARVEST_PER_ORIGIN_CAP", "10")
           .set("HARVEST_PACE_MIN_MS", "0")
           .set("HARVEST_PACE_MAX_MS", "250")
           .set("HARVEST_MAX_WORDS_PER_PAGE", "0")
           .set("SPA_RENDERING_TIMEOUT", "45000")
           .set("HARVEST_ARCHIVE_FALLBACK", "off")
           .set("HARVEST_RENDERING", "No")
           .set("BROWSERLESS_URL", "http://localhost:3001")
           .set("HARVEST_PROXY", "socks5://127.0.0.1:9050");

        CrawlConfig config = loadConfigFromEnvironment();
        REQUIRE(config.maxDepth == 4);
        REQUIRE(config.maxPages == 50);
        REQUIRE(config.perOriginCap == 10);
        REQUIRE(config.paceMin.count() == 0);
        REQUIRE(config.paceMax.count() == 250);
        REQUIRE(config.maxWordsPerPage == 0);
        REQUIRE(config.renderTimeout.count() == 45000);
        REQUIRE_FALSE(config.archiveFallbackEnabled);
        REQUIRE_FALSE(config.renderingEnabled);
        REQUIRE(config.browserlessUrl == "http://localhost:3001");
        REQUIRE(config.proxy == "socks5://127.0.0.1:9050");
    }

    SECTION("Invalid values are ignored") {
        ScopedEnv env;
        env.set("HARVEST_MAX_PAGES", "lots")
           .set("HARVEST_MAX_DEPTH", "-1")
           .set("HARVEST_PER_ORIGIN_CAP", "3x")
           .set("HARVEST_RENDERING", "maybe");

        CrawlConfig base;
        base.maxPages = 9;
        CrawlConfig config = loadConfigFromEnvironment(base);
        REQUIRE(config.maxPages == 9);
        REQUIRE(config.maxDepth == 2);
        REQUIRE(config.perOriginCap == 5);
        REQUIRE(config.renderingEnabled);
    }
}

TEST_CASE("validateConfig rejects unusable configurations", "[ConfigLoader]") {
    REQUIRE_NOTHROW(validateConfig(CrawlConfig{}));

    CrawlConfig config;

    SECTION("Zero budgets") {
        config.maxPages = 0;
        REQUIRE_THROWS_AS(validateConfig(config), std::invalid_argument);
    }

    SECTION("Zero per-origin cap") {
        config.perOriginCap = 0;
        REQUIRE_THROWS_AS(validateConfig(config), std::invalid_argument);
    }

    SECTION("No concurrency") {
        config.maxConcurrentOrigins = 0;
        REQUIRE_THROWS_AS(validateConfig(config), std::invalid_argument);
    }

    SECTION("Inverted pacing window") {
        config.paceMin = std::chrono::milliseconds(500);
        config.paceMax = std::chrono::milliseconds(100);
        REQUIRE_THROWS_AS(validateConfig(config), std::invalid_argument);
    }

    SECTION("Pace multiplier below one") {
        config.maxPaceMultiplier = 0.5;
        REQUIRE_THROWS_AS(validateConfig(config), std::invalid_argument);
    }

    SECTION("Out of range duplicate threshold") {
        config.nearDuplicateThreshold = 1.5;
        REQUIRE_THROWS_AS(validateConfig(config), std::invalid_argument);
    }

    SECTION("Rendering needs a usable Browserless URL") {
        config.browserlessUrl = "browserless";
        REQUIRE_THROWS_AS(validateConfig(config), std::invalid_argument);
        config.renderingEnabled = false;
        REQUIRE_NOTHROW(validateConfig(config));
    }

    SECTION("Depth zero is allowed") {
        config.maxDepth = 0;
        REQUIRE_NOTHROW(validateConfig(config));
    }
}
