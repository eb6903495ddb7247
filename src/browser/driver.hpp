#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include "browser_config.hpp"
#include "page.hpp"

namespace Glimpse {
namespace Browser {

// A running browser process with one page attached.
class Session {
public:
    virtual ~Session() = default;

    virtual Page& page() = 0;

    // Stops the process. Safe to call more than once.
    virtual void terminate() = 0;
};

class Driver {
public:
    virtual ~Driver() = default;

    // Throws BrowserStartError when the browser cannot be brought up.
    virtual boost::asio::awaitable<std::unique_ptr<Session>> launch(const BrowserConfig& config) = 0;
};

}  // namespace Browser
}  // namespace Glimpse
