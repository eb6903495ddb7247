#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <memory>

namespace Glimpse {
namespace Server {

class HttpServer;

// One client connection; serves requests sequentially until the peer closes
// or asks for Connection: close.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(boost::asio::ip::tcp::socket socket, HttpServer* server);
    ~Connection();

    void start();

private:
    boost::asio::awaitable<void> start_impl();
    void                         close();

    static constexpr auto kReadTimeout = std::chrono::seconds(30);

    boost::beast::tcp_stream stream_;
    HttpServer*              server_;
};

}  // namespace Server
}  // namespace Glimpse
