#include <catch2/catch_test_macros.hpp>
#include "Crawler.h"
#include "support/TestDoubles.h"

namespace {

const std::string kOrigin = "https://example.com";
const std::string kSeed = "https://example.com/";

struct CrawlerFixture {
    CrawlConfig config;
    FakeHttpTransport transport;
    CrawlSession session;
    IdentityPool identity;
    FetchStrategyChain chain;
    TopicRelevanceFilter filter;

    explicit CrawlerFixture(CrawlConfig base = fastTestConfig(), const std::string& topic = "solar")
        : config(disableFallbacks(base))
        , session(config)
        , identity(config)
        , chain(FetchStrategyChain::createDefault(config, transport, nullptr))
        , filter(topic) {
    }

    static CrawlConfig disableFallbacks(CrawlConfig config) {
        config.renderingEnabled = false;
        config.archiveFallbackEnabled = false;
        return config;
    }

    OriginCorpus crawl(const std::string& seed = kSeed) {
        Crawler crawler(kOrigin, config, session, identity, chain, filter);
        crawler.addSeedURL(seed);
        OriginCorpus corpus = crawler.run();
        REQUIRE(crawler.getState() == corpus.finalState);
        return corpus;
    }
};

} // namespace

TEST_CASE("Crawler stays on its origin", "[Crawler]") {
    CrawlerFixture fx;
    fx.transport.respond(kSeed, 200, R"(
        <body><article>
          <p>Solar panels on every roof.</p>
          <p><a href="https://other.org/solar">solar elsewhere</a></p>
          <p><a href="https://news.example.net/solar">more solar news</a></p>
        </article></body>)");

    OriginCorpus corpus = fx.crawl();

    REQUIRE(corpus.finalState == CrawlState::COMPLETED);
    REQUIRE(corpus.pagesFetched == 1);
    REQUIRE(corpus.pagesWithText == 1);
    REQUIRE(corpus.text.find("Solar panels on every roof.") != std::string::npos);
    REQUIRE(fx.transport.requests().size() == 1);
    REQUIRE(fx.session.getVisitedCount() == 1);
}

TEST_CASE("Crawler follows only topical links within the depth limit", "[Crawler]") {
    CrawlConfig config = fastTestConfig();
    config.maxDepth = 1;
    CrawlerFixture fx(config);

    fx.transport.respond(kSeed, 200, R"(
        <body><main>
          <p>Solar basics for beginners.</p>
          <ul>
            <li><a href="/solar-costs">Costs</a></li>
            <li><a href="/about">About us</a></li>
          </ul>
        </main></body>)");
    fx.transport.respond(kOrigin + "/solar-costs", 200, R"(
        <body><main>
          <p>Solar costs fell again.</p>
          <p><a href="/solar-deeper">deeper solar</a></p>
        </main></body>)");
    fx.transport.respond(kOrigin + "/solar-deeper", 200, "<body><p>Solar too deep</p></body>");

    OriginCorpus corpus = fx.crawl();

    REQUIRE(corpus.finalState == CrawlState::COMPLETED);
    REQUIRE(corpus.pagesFetched == 2);
    REQUIRE(fx.transport.requestCount(kOrigin + "/about") == 0);
    REQUIRE(fx.transport.requestCount(kOrigin + "/solar-deeper") == 0);
    REQUIRE(corpus.text.find("Solar basics for beginners.") != std::string::npos);
    REQUIRE(corpus.text.find("Solar costs fell again.") != std::string::npos);
    REQUIRE(corpus.text.find("About us") == std::string::npos);
    REQUIRE(corpus.text.find("\n\n") != std::string::npos);
}

TEST_CASE("Crawler reports exhaustion at the per-origin cap", "[Crawler]") {
    CrawlConfig config = fastTestConfig();
    config.perOriginCap = 2;
    CrawlerFixture fx(config);

    fx.transport.respond(kSeed, 200, R"(
        <body><article>
          <p>Solar index</p>
          <a href="/solar-a">solar a</a> <a href="/solar-b">solar b</a> <a href="/solar-c">solar c</a>
        </article></body>)");
    fx.transport.respond(kOrigin + "/solar-a", 200, "<body><p>Solar page a</p></body>");
    fx.transport.respond(kOrigin + "/solar-b", 200, "<body><p>Solar page b</p></body>");
    fx.transport.respond(kOrigin + "/solar-c", 200, "<body><p>Solar page c</p></body>");

    OriginCorpus corpus = fx.crawl();

    REQUIRE(corpus.finalState == CrawlState::EXHAUSTED);
    REQUIRE(corpus.pagesFetched == 2);
    REQUIRE(fx.session.getPagesFetched(kOrigin) == 2);
}

TEST_CASE("Crawler skips pages that cannot be fetched", "[Crawler]") {
    CrawlerFixture fx;
    fx.transport.respond(kSeed, 200, R"(<body><p>Solar hub <a href="/solar-gone">solar gone</a> <a href="/solar-ok">solar ok</a></p></body>)");
    fx.transport.respond(kOrigin + "/solar-gone", 404, "");
    fx.transport.respond(kOrigin + "/solar-ok", 200, "<body><p>Solar still here</p></body>");

    OriginCorpus corpus = fx.crawl();

    REQUIRE(corpus.finalState == CrawlState::COMPLETED);
    REQUIRE(corpus.pagesFetched == 3);
    REQUIRE(corpus.pagesWithText == 2);
    REQUIRE(corpus.text.find("Solar still here") != std::string::npos);
}

TEST_CASE("Crawler drops repeated paragraphs across pages", "[Crawler]") {
    CrawlerFixture fx;
    const std::string boilerplate = "<p>Solar newsletter signup for weekly solar updates</p>";
    fx.transport.respond(kSeed, 200, "<body>" + boilerplate + "<p>Solar first page</p><a href=\"/solar-2\">solar 2</a></body>");
    fx.transport.respond(kOrigin + "/solar-2", 200, "<body>" + boilerplate + "<p>Solar second page</p></body>");

    OriginCorpus corpus = fx.crawl();
    const std::string signup = "Solar newsletter signup";

    const size_t first = corpus.text.find(signup);
    REQUIRE(first != std::string::npos);
    REQUIRE(corpus.text.find(signup, first + 1) == std::string::npos);
    REQUIRE(corpus.text.find("Solar second page") != std::string::npos);

    SECTION("Repeats are kept when deduplication is off") {
        CrawlConfig config = fastTestConfig();
        config.deduplicateParagraphs = false;
        CrawlerFixture plain(config);
        plain.transport.respond(kSeed, 200, "<body>" + boilerplate + "<p>Solar first page</p><a href=\"/solar-2\">solar 2</a></body>");
        plain.transport.respond(kOrigin + "/solar-2", 200, "<body>" + boilerplate + "<p>Solar second page</p></body>");

        OriginCorpus repeated = plain.crawl();
        const size_t at = repeated.text.find(signup);
        REQUIRE(repeated.text.find(signup, at + 1) != std::string::npos);
    }
}

TEST_CASE("Crawler with an empty frontier completes immediately", "[Crawler]") {
    CrawlerFixture fx;
    Crawler crawler(kOrigin, fx.config, fx.session, fx.identity, fx.chain, fx.filter);
    REQUIRE(crawler.getState() == CrawlState::IDLE);
    OriginCorpus corpus = crawler.run();
    REQUIRE(corpus.finalState == CrawlState::COMPLETED);
    REQUIRE(corpus.text.empty());
    REQUIRE(corpus.wordCount == 0);
}

TEST_CASE("Crawler visits each page of a cyclic site once, layer by layer", "[Crawler]") {
    CrawlConfig config = fastTestConfig();
    config.maxDepth = 3;
    CrawlerFixture fx(config);

    const std::string pageA = "https://example.com/solar-a";
    const std::string pageB = "https://example.com/solar-b";
    const std::string pageC = "https://example.com/solar-c";

    fx.transport.respond(kSeed, 200, R"(<body><article><p>Solar home.</p>
        <a href="/solar-a">solar a</a> <a href="/solar-b">solar b</a></article></body>)");
    fx.transport.respond(pageA, 200, R"(<body><article><p>Solar page A.</p>
        <a href="/solar-b">solar b</a> <a href="/solar-c">solar c</a></article></body>)");
    fx.transport.respond(pageB, 200, R"(<body><article><p>Solar page B.</p>
        <a href="/solar-a">solar a</a> <a href="/solar-c">solar c</a></article></body>)");
    fx.transport.respond(pageC, 200, R"(<body><article><p>Solar page C.</p>
        <a href="/">solar home</a> <a href="/solar-a">solar a</a></article></body>)");

    OriginCorpus corpus = fx.crawl();

    REQUIRE(corpus.finalState == CrawlState::COMPLETED);
    REQUIRE(corpus.pagesFetched == 4);
    REQUIRE(fx.session.getVisitedCount() == 4);
    for (const auto& url : {kSeed, pageA, pageB, pageC}) {
        REQUIRE(fx.transport.requestCount(url) == 1);
    }

    std::vector<std::string> fetched;
    for (const auto& entry : fx.session.getFetchLog()) {
        fetched.push_back(entry.url);
    }
    REQUIRE(fetched == std::vector<std::string>{kSeed, pageA, pageB, pageC});
}

TEST_CASE("Crawler caps the words kept from each page", "[Crawler]") {
    CrawlConfig config = fastTestConfig();
    config.maxWordsPerPage = 3;
    CrawlerFixture fx(config);
    fx.transport.respond(kSeed, 200, "<body><article><p>Solar one two three four</p><p>solar again</p></article></body>");

    OriginCorpus corpus = fx.crawl();

    REQUIRE(corpus.text == "Solar one two");
    REQUIRE(corpus.wordCount == 3);
}
