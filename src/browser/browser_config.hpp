#pragma once
#include <string>
#include <vector>
#include "glimpse/capture.hpp"

namespace Glimpse {
namespace Browser {

// Launch-time configuration for one browser process. Derived per request.
struct BrowserConfig {
    std::string executable;
    int         width  = CaptureDefaults::WIDTH;
    int         height = CaptureDefaults::HEIGHT;
    std::string user_agent;

    bool headless        = true;
    bool disable_gpu     = true;
    bool disable_sandbox = false;
    bool hide_scrollbars = false;

    // Command line flags, without the executable itself.
    std::vector<std::string> arguments() const;

    static BrowserConfig from(const CaptureRequest& request, const Settings& settings);
};

}  // namespace Browser
}  // namespace Glimpse
