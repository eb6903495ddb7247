#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "browser_session.hpp"
#include "glimpse/capture.hpp"
#include "sleeper.hpp"

namespace Glimpse {
namespace Capture {

class PageCapture {
public:
    // Largest of the six height measurements; they disagree on some layouts.
    static constexpr const char* kPageHeightScript =
        "Math.max(document.body.scrollHeight, document.documentElement.scrollHeight, "
        "document.body.offsetHeight, document.documentElement.offsetHeight, "
        "document.body.clientHeight, document.documentElement.clientHeight)";

    PageCapture(std::chrono::seconds timeout, std::shared_ptr<Sleeper> sleeper);

    // Navigate, wait, optionally grow the viewport to the page height, and
    // return the PNG bytes of the viewport. Single attempt.
    boost::asio::awaitable<std::string> capture(SessionHandle&        session,
                                                const CaptureRequest& request) const;

    // Floors numbers and numeric strings; anything else, or a non-positive
    // height, yields the fallback height.
    static int coerce_height(const nlohmann::json& value);

private:
    boost::asio::awaitable<int> measure_height(Browser::Page& page) const;

    std::chrono::seconds     timeout_;
    std::shared_ptr<Sleeper> sleeper_;
};

}  // namespace Capture
}  // namespace Glimpse
