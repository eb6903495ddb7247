#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace Glimpse {
namespace Browser {

// One controllable tab. Failures are reported with the Glimpse error types.
class Page {
public:
    virtual ~Page() = default;

    // Budget shared by page load, readiness and in-page script evaluation.
    virtual void set_timeout(std::chrono::seconds timeout) = 0;

    virtual boost::asio::awaitable<void> set_viewport(int width, int height) = 0;
    virtual boost::asio::awaitable<void> goto_url(const std::string& url)    = 0;

    virtual boost::asio::awaitable<nlohmann::json> evaluate(const std::string& script) = 0;

    // PNG bytes of the current viewport.
    virtual boost::asio::awaitable<std::string> screenshot() = 0;
};

}  // namespace Browser
}  // namespace Glimpse
