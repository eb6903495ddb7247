#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include "driver.hpp"

namespace Glimpse {
namespace Browser {

// Driver backed by a local Chromium spoken to over the DevTools protocol.
// Every launch gets its own process, profile and DevTools port.
class ChromeDriver : public Driver {
public:
    ChromeDriver() = default;

    boost::asio::awaitable<std::unique_ptr<Session>> launch(const BrowserConfig& config) override;
};

}  // namespace Browser
}  // namespace Glimpse
