#include <catch2/catch_test_macros.hpp>
#include "FetchStrategyChain.h"
#include "RenderFetchStrategy.h"
#include "support/TestDoubles.h"

#include <stdexcept>

namespace {

const std::string kPage = "https://example.com/article";

class ThrowingStrategy : public FetchStrategy {
public:
    FetchStrategyKind kind() const override { return FetchStrategyKind::DIRECT; }
    StrategyOutcome attempt(FetchAttemptContext&) override {
        throw std::runtime_error("parser blew up");
    }
};

std::vector<FetchStrategyKind> loggedStrategies(const CrawlSession& session) {
    std::vector<FetchStrategyKind> kinds;
    for (const auto& entry : session.getFetchLog()) {
        kinds.push_back(entry.strategy);
    }
    return kinds;
}

} // namespace

TEST_CASE("FetchStrategyChain default composition", "[FetchStrategyChain]") {
    CrawlConfig config = fastTestConfig();
    FakeHttpTransport transport;
    FakeRenderer renderer;

    SECTION("Direct, rendered, archived") {
        auto chain = FetchStrategyChain::createDefault(config, transport, &renderer);
        REQUIRE(chain.kinds() == std::vector<FetchStrategyKind>{
            FetchStrategyKind::DIRECT, FetchStrategyKind::RENDERED, FetchStrategyKind::ARCHIVED});
    }

    SECTION("Rendering is skipped without a renderer or when disabled") {
        REQUIRE(FetchStrategyChain::createDefault(config, transport, nullptr).size() == 2);
        config.renderingEnabled = false;
        REQUIRE(FetchStrategyChain::createDefault(config, transport, &renderer).size() == 2);
    }

    SECTION("Archive can be disabled") {
        config.archiveFallbackEnabled = false;
        REQUIRE(FetchStrategyChain::createDefault(config, transport, &renderer).kinds() ==
                std::vector<FetchStrategyKind>{FetchStrategyKind::DIRECT, FetchStrategyKind::RENDERED});
    }
}

TEST_CASE("FetchStrategyChain falls back in order", "[FetchStrategyChain]") {
    CrawlConfig config = fastTestConfig();
    FakeHttpTransport transport;
    FakeRenderer renderer;
    IdentityPool identity(config);
    auto chain = FetchStrategyChain::createDefault(config, transport, &renderer);

    SECTION("Direct success stops the chain") {
        CrawlSession session(20, 5);
        transport.respond(kPage, 200, "<p>direct</p>");
        auto result = chain.fetch(kPage, session, identity);
        REQUIRE(result.html == std::optional<std::string>("<p>direct</p>"));
        REQUIRE(result.strategyUsed == FetchStrategyKind::DIRECT);
        REQUIRE(result.origin == "https://example.com");
        REQUIRE(renderer.calls().empty());
    }

    SECTION("An unresolvable host is flagged") {
        CrawlSession session(20, 5);
        transport.failWithCurl(kPage, CURLE_COULDNT_RESOLVE_HOST);
        auto result = chain.fetch(kPage, session, identity);
        REQUIRE_FALSE(result.html.has_value());
        REQUIRE(result.hostUnreachable);
    }

    SECTION("An HTTP error is not an unreachable host") {
        CrawlSession session(20, 5);
        transport.respond(kPage, 404, "missing");
        REQUIRE_FALSE(chain.fetch(kPage, session, identity).hostUnreachable);
    }

    SECTION("Blocked direct fetch falls back to rendering") {
        CrawlSession session(20, 5);
        transport.respond(kPage, 403, "blocked");
        renderer.renders(kPage, "<p>rendered</p>");
        auto result = chain.fetch(kPage, session, identity);
        REQUIRE(result.strategyUsed == FetchStrategyKind::RENDERED);
        REQUIRE(result.html == std::optional<std::string>("<p>rendered</p>"));
        REQUIRE(loggedStrategies(session) == std::vector<FetchStrategyKind>{
            FetchStrategyKind::DIRECT, FetchStrategyKind::RENDERED});
        REQUIRE(session.getPagesCrawled() == 2);
    }

    SECTION("Archive is the last resort") {
        CrawlSession session(20, 5);
        const std::string snapshot = "http://web.archive.org/web/20200101000000/" + kPage;
        transport.respond(kPage, 404, "");
        transport.respond(archiveLookupUrl(kPage), 200, R"({"last_ts":"20200101000000"})");
        transport.respond(snapshot, 200, "<p>old</p>");
        auto result = chain.fetch(kPage, session, identity);
        REQUIRE(result.strategyUsed == FetchStrategyKind::ARCHIVED);
        REQUIRE(result.servedFrom == snapshot);
        REQUIRE(loggedStrategies(session) == std::vector<FetchStrategyKind>{
            FetchStrategyKind::DIRECT, FetchStrategyKind::RENDERED, FetchStrategyKind::ARCHIVED});
    }

    SECTION("Every strategy failing yields no html") {
        CrawlSession session(20, 5);
        transport.respond(kPage, 404, "");
        auto result = chain.fetch(kPage, session, identity);
        REQUIRE_FALSE(result.html.has_value());
        REQUIRE_FALSE(result.budgetExhausted);
        REQUIRE(result.strategyUsed == FetchStrategyKind::NONE);
    }

    SECTION("A budget denial ends the chain") {
        CrawlSession session(1, 5);
        transport.respond(kPage, 403, "blocked");
        renderer.renders(kPage, "<p>rendered</p>");
        auto result = chain.fetch(kPage, session, identity);
        REQUIRE(result.budgetExhausted);
        REQUIRE_FALSE(result.html.has_value());
        REQUIRE(renderer.calls().empty());
        REQUIRE(transport.requestCount(archiveLookupUrl(kPage)) == 0);
        REQUIRE(session.getPagesCrawled() == 1);
    }
}

TEST_CASE("FetchStrategyChain error propagation", "[FetchStrategyChain]") {
    CrawlConfig config = fastTestConfig();
    FakeHttpTransport transport;
    IdentityPool identity(config);
    CrawlSession session(20, 5);

    SECTION("Network unavailability aborts the fetch") {
        auto chain = FetchStrategyChain::createDefault(config, transport, nullptr);
        transport.takeNetworkDown();
        REQUIRE_THROWS_AS(chain.fetch(kPage, session, identity), NetworkUnavailableError);
    }

    SECTION("Other strategy exceptions fall through to the next strategy") {
        FakeRenderer renderer;
        renderer.renders(kPage, "<p>rendered</p>");
        FetchStrategyChain chain;
        chain.addStrategy(std::make_unique<ThrowingStrategy>());
        chain.addStrategy(std::make_unique<RenderFetchStrategy>(renderer, config));
        auto result = chain.fetch(kPage, session, identity);
        REQUIRE(result.strategyUsed == FetchStrategyKind::RENDERED);
        REQUIRE(result.html == std::optional<std::string>("<p>rendered</p>"));
    }
}
