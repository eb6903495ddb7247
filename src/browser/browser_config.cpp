#include "browser_config.hpp"

namespace Glimpse {
namespace Browser {

std::vector<std::string> BrowserConfig::arguments() const {
    std::vector<std::string> args;
    if (headless)
        args.push_back("--headless");
    if (disable_gpu)
        args.push_back("--disable-gpu");
    args.push_back("--window-size=" + std::to_string(width) + "," + std::to_string(height));
    if (!user_agent.empty())
        args.push_back("--user-agent=" + user_agent);
    if (disable_sandbox) {
        args.push_back("--no-sandbox");
        args.push_back("--disable-dev-shm-usage");
    }
    if (hide_scrollbars)
        args.push_back("--hide-scrollbars");

    args.push_back("--disable-extensions");
    args.push_back("--disable-notifications");
    args.push_back("--no-first-run");
    args.push_back("--no-default-browser-check");
    return args;
}

BrowserConfig BrowserConfig::from(const CaptureRequest& request, const Settings& settings) {
    BrowserConfig config;
    config.executable      = settings.browser_path;
    config.width           = request.effective_width();
    config.height          = request.effective_height();
    config.user_agent      = settings.user_agent;
    config.disable_sandbox = settings.disable_sandbox;
    config.hide_scrollbars = request.full_page;
    return config;
}

}  // namespace Browser
}  // namespace Glimpse
