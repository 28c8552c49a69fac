#include "RenderFetchStrategy.h"
#include "../../include/Logger.h"

RenderFetchStrategy::RenderFetchStrategy(PageRenderer& renderer, const CrawlConfig& config)
    : renderer_(renderer), timeout_(config.renderTimeout) {
}

StrategyOutcome RenderFetchStrategy::attempt(FetchAttemptContext& context) {
    if (!context.beginAttempt(kind())) {
        return StrategyOutcome::failed("budget exhausted");
    }

    RenderOptions options;
    options.timeout = timeout_;
    options.waitForNetworkIdle = true;
    options.stealth = true;
    for (const auto& [name, value] : context.headers()) {
        if (name == "User-Agent") {
            options.userAgent = value;
        } else {
            options.headers[name] = value;
        }
    }

    LOG_INFO("Rendering " + context.url() + " in headless browser");
    BrowserlessRenderResult rendered = renderer_.renderUrl(context.url(), options);

    if (rendered.success && !rendered.html.empty()) {
        return StrategyOutcome::succeeded(std::move(rendered.html), rendered.status_code);
    }

    const std::string error = rendered.error.empty() ? "render returned no content" : rendered.error;
    LOG_WARNING("Render failed for " + context.url() + ": " + error);
    return StrategyOutcome::failed(error, rendered.status_code);
}
