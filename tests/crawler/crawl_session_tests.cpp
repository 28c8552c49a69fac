#include <catch2/catch_test_macros.hpp>
#include "CrawlSession.h"

#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("CrawlSession visited set", "[CrawlSession]") {
    CrawlSession session(20, 5);

    REQUIRE_FALSE(session.isVisited("https://a.com/"));
    REQUIRE(session.markVisited("https://a.com/"));
    REQUIRE(session.isVisited("https://a.com/"));
    REQUIRE_FALSE(session.markVisited("https://a.com/"));
    REQUIRE(session.getVisitedCount() == 1);
}

TEST_CASE("CrawlSession reserves budget and logs the attempt together", "[CrawlSession]") {
    CrawlSession session(3, 2);

    REQUIRE(session.reserveAttempt({"https://a.com/1", "https://a.com", FetchStrategyKind::DIRECT}));
    REQUIRE(session.reserveAttempt({"https://a.com/1", "https://a.com", FetchStrategyKind::RENDERED}));
    REQUIRE_FALSE(session.reserveAttempt({"https://a.com/2", "https://a.com", FetchStrategyKind::DIRECT}));
    REQUIRE(session.reserveAttempt({"https://b.com/", "https://b.com", FetchStrategyKind::ARCHIVED}));
    REQUIRE_FALSE(session.reserveAttempt({"https://c.com/", "https://c.com", FetchStrategyKind::DIRECT}));

    auto log = session.getFetchLog();
    REQUIRE(log.size() == 3);
    REQUIRE(log[0].strategy == FetchStrategyKind::DIRECT);
    REQUIRE(log[1].strategy == FetchStrategyKind::RENDERED);
    REQUIRE(log[2].origin == "https://b.com");
    REQUIRE(session.getPagesCrawled() == 3);
    REQUIRE(session.getPagesFetched("https://a.com") == 2);
}

TEST_CASE("CrawlSession stays consistent under concurrent reservations", "[CrawlSession]") {
    const size_t maxPages = 50;
    const size_t perOriginCap = 8;
    CrawlSession session(maxPages, perOriginCap);

    const std::vector<std::string> origins = {
        "https://a.com", "https://b.com", "https://c.com", "https://d.com",
        "https://e.com", "https://f.com", "https://g.com", "https://h.com"
    };

    std::atomic<size_t> granted{0};
    std::vector<std::thread> threads;
    for (const auto& origin : origins) {
        threads.emplace_back([&session, &granted, origin]() {
            for (int i = 0; i < 100; ++i) {
                if (session.reserveAttempt({origin + "/" + std::to_string(i), origin, FetchStrategyKind::DIRECT})) {
                    ++granted;
                }
                session.markVisited(origin + "/" + std::to_string(i % 10));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(granted.load() == maxPages);
    REQUIRE(session.getPagesCrawled() == maxPages);
    REQUIRE(session.getFetchLog().size() == maxPages);
    for (const auto& [origin, count] : session.getOriginCounts()) {
        REQUIRE(count <= perOriginCap);
    }
    REQUIRE(session.getVisitedCount() == origins.size() * 10);
}
