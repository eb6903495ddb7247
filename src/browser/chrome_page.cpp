#include "chrome_page.hpp"

namespace Glimpse {
namespace Browser {

ChromePage::ChromePage(std::shared_ptr<CDP::CDPClient> cdp) : cdp_(std::move(cdp)) {
}

void ChromePage::set_timeout(std::chrono::seconds timeout) {
    cdp_->set_timeout(timeout);
}

boost::asio::awaitable<void> ChromePage::set_viewport(int width, int height) {
    co_await cdp_->set_device_metrics(width, height);
}

boost::asio::awaitable<void> ChromePage::goto_url(const std::string& url) {
    co_await cdp_->navigate(url);
}

boost::asio::awaitable<nlohmann::json> ChromePage::evaluate(const std::string& script) {
    co_return co_await cdp_->evaluate(script);
}

boost::asio::awaitable<std::string> ChromePage::screenshot() {
    co_return co_await cdp_->capture_screenshot();
}

}  // namespace Browser
}  // namespace Glimpse
