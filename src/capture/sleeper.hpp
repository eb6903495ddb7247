#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>

namespace Glimpse {
namespace Capture {

// Suspends the calling coroutine. Swapped for a fake clock in tests.
class Sleeper {
public:
    virtual ~Sleeper() = default;

    virtual boost::asio::awaitable<void> sleep_for(std::chrono::milliseconds duration) = 0;
};

class TimerSleeper : public Sleeper {
public:
    boost::asio::awaitable<void> sleep_for(std::chrono::milliseconds duration) override;
};

}  // namespace Capture
}  // namespace Glimpse
