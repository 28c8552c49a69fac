#include <catch2/catch_test_macros.hpp>
#include "BudgetTracker.h"

TEST_CASE("BudgetTracker enforces global and per-origin limits", "[BudgetTracker]") {
    SECTION("Per-origin cap stops one origin but not others") {
        BudgetTracker budget(10, 2);
        REQUIRE(budget.tryReserve("https://a.com"));
        REQUIRE(budget.tryReserve("https://a.com"));
        REQUIRE_FALSE(budget.tryReserve("https://a.com"));
        REQUIRE_FALSE(budget.hasOriginCapacity("https://a.com"));

        REQUIRE(budget.canReserve("https://b.com"));
        REQUIRE(budget.tryReserve("https://b.com"));

        REQUIRE(budget.getPagesCrawled() == 3);
        REQUIRE(budget.getPagesFetched("https://a.com") == 2);
        REQUIRE(budget.getPagesFetched("https://b.com") == 1);
        REQUIRE(budget.getPagesFetched("https://c.com") == 0);
    }

    SECTION("Global limit stops every origin") {
        BudgetTracker budget(2, 5);
        REQUIRE(budget.tryReserve("https://a.com"));
        REQUIRE(budget.tryReserve("https://b.com"));
        REQUIRE(budget.isGloballyExhausted());
        REQUIRE_FALSE(budget.canReserve("https://c.com"));
        REQUIRE_FALSE(budget.tryReserve("https://c.com"));
        // Origin capacity alone is still reported
        REQUIRE(budget.hasOriginCapacity("https://c.com"));
    }

    SECTION("A denied reservation changes nothing") {
        BudgetTracker budget(1, 1);
        REQUIRE(budget.tryReserve("https://a.com"));
        REQUIRE_FALSE(budget.tryReserve("https://b.com"));
        REQUIRE(budget.getPagesCrawled() == 1);
        REQUIRE(budget.getOriginCounts().count("https://b.com") == 0);
    }

    SECTION("Configuration constructor copies the limits") {
        CrawlConfig config;
        config.maxPages = 7;
        config.perOriginCap = 3;
        BudgetTracker budget(config);
        REQUIRE(budget.getMaxPages() == 7);
        REQUIRE(budget.getPerOriginCap() == 3);
    }
}
