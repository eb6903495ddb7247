#pragma once
#include <chrono>
#include <cstddef>

namespace Glimpse {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "0.1.0";

    static constexpr const char* DEFAULT_BIND_IP        = "127.0.0.1";
    static constexpr int         DEFAULT_PORT           = 8080;
    static constexpr int         DEFAULT_THREADS        = 4;
    static constexpr const char* DEFAULT_STORAGE_PATH   = "storage";
    static constexpr int         DEFAULT_TIMEOUT        = 30;  // seconds
    static constexpr const char* DEFAULT_ALLOWED_ORIGIN = "http://localhost:3000";
    static constexpr const char* DEFAULT_USER_AGENT =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/124.0.0.0 Safari/537.36 Glimpse/0.1";

    static constexpr const char* IMAGE_EXTENSION = ".png";
    static constexpr int         FALLBACK_PAGE_HEIGHT = 768;

    // Reflow grace period after a full-page resize.
    static constexpr std::chrono::milliseconds SETTLE_DELAY{500};

    static constexpr std::chrono::milliseconds BROWSER_START_TIMEOUT{10000};
    static constexpr std::chrono::milliseconds BROWSER_STOP_TIMEOUT{3000};
    static constexpr std::size_t               MAX_CDP_MESSAGE = 64 * 1024 * 1024;
    static constexpr std::size_t               MAX_REQUEST_BODY = 64 * 1024;
};

}  // namespace Core
}  // namespace Glimpse
