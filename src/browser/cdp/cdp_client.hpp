#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace Glimpse {
namespace Browser {
namespace CDP {

// Protocol-level failure: an "error" member in a command response, or a
// dropped connection.
class CommandError : public std::runtime_error {
public:
    CommandError(const std::string& method, const std::string& message, bool timed_out = false)
        : std::runtime_error(method + ": " + message), timed_out_(timed_out) {
    }

    bool timed_out() const {
        return timed_out_;
    }

private:
    std::string                                               host_;
    int                                                       port_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::asio::steady_timer                                 arrival_;
    bool                                                      connected_ = false;
    boost::system::error_code                                 read_error_;
    std::chrono::seconds                                      timeout_{30};

    int         current_id_ = 1;
    std::string tab_id_;

    std::map<int, nlohmann::json> responses_;
    std::deque<nlohmann::json>    events_;
    std::set<int>                 abandoned_;

    std::string                            get_web_socket_url();
    boost::asio::awaitable<void>           send_message(const nlohmann::json& msg);
    boost::asio::awaitable<nlohmann::json> read_message();
    boost::asio::awaitable<void>           read_loop();
    void                                   dispatch(nlohmann::json msg);

    boost::asio::awaitable<void> wait_for_arrival(Clock::time_point deadline);
    boost::asio::awaitable<std::optional<nlohmann::json>> wait_for_id(int               id,
                                                                      Clock::time_point deadline);
    boost::asio::awaitable<std::optional<nlohmann::json>>
    wait_for_event(const std::string& method, Clock::time_point deadline);
    std::string closed_reason() const;
};

}  // namespace CDP
}  // namespace Browser
}  // namespace Glimpse
