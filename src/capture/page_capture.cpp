#include "page_capture.hpp"
#include <cmath>
#include <limits>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/url/url.hpp"
#include "glimpse/errors.hpp"

namespace Glimpse {
namespace Capture {

using namespace Glimpse::Core;

PageCapture::PageCapture(std::chrono::seconds timeout, std::shared_ptr<Sleeper> sleeper)
    : timeout_(timeout), sleeper_(std::move(sleeper)) {
}

boost::asio::awaitable<std::string> PageCapture::capture(SessionHandle&        session,
                                                         const CaptureRequest& request) const {
    Browser::Page& page   = session.page();
    const int      width  = request.effective_width();
    const int      height = request.effective_height();

    page.set_timeout(timeout_);
    co_await page.set_viewport(width, height);

    if (!Utils::Url::is_navigable(request.url))
        throw NavigationError("Invalid URL: " + request.url);

    Logger::info("Capture: Navigating to " + request.url);
    co_await page.goto_url(request.url);

    const int delay = request.effective_delay();
    if (delay > 0) {
        Logger::info("Capture: Waiting " + std::to_string(delay) + "s before capture");
        co_await sleeper_->sleep_for(std::chrono::seconds(delay));
    }

    if (request.full_page) {
        int page_height = co_await measure_height(page);
        Logger::info("Capture: Resizing viewport to " + std::to_string(width) + "x"
                     + std::to_string(page_height));
        co_await page.set_viewport(width, page_height);
        co_await sleeper_->sleep_for(Constants::SETTLE_DELAY);
    }

    std::string bytes = co_await page.screenshot();
    if (bytes.empty())
        throw CaptureError("Browser returned an empty screenshot");
    co_return bytes;
}

boost::asio::awaitable<int> PageCapture::measure_height(Browser::Page& page) const {
    nlohmann::json value;
    try {
        value = co_await page.evaluate(kPageHeightScript);
    } catch (const ScriptEvaluationError& e) {
        Logger::warn("Capture: Height measurement failed, using "
                     + std::to_string(Constants::FALLBACK_PAGE_HEIGHT) + "px: " + e.what());
        co_return Constants::FALLBACK_PAGE_HEIGHT;
    }
    co_return coerce_height(value);
}

int PageCapture::coerce_height(const nlohmann::json& value) {
    double numeric = std::numeric_limits<double>::quiet_NaN();

    if (value.is_number()) {
        numeric = value.get<double>();
    }
    else if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            double parsed   = std::stod(text, &consumed);
            if (consumed == text.size())
                numeric = parsed;
        } catch (const std::exception&) {
            // not numeric
        }
    }

    if (!std::isfinite(numeric))
        return Constants::FALLBACK_PAGE_HEIGHT;

    double floored = std::floor(numeric);
    if (floored < 1.0 || floored > std::numeric_limits<int>::max())
        return Constants::FALLBACK_PAGE_HEIGHT;
    return static_cast<int>(floored);
}

}  // namespace Capture
}  // namespace Glimpse
