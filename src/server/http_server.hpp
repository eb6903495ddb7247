#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "screenshot_handler.hpp"

namespace Glimpse {
namespace Server {

class Connection;

class HttpServer {
public:
    HttpServer(std::shared_ptr<const ScreenshotHandler> handler,
               const std::string&                       bind_ip,
               int                                      bind_port,
               int                                      thread_count);
    ~HttpServer();

    // Binds and starts the IO threads. Throws std::runtime_error when the
    // address cannot be bound.
    void start();
    void stop();
    int  get_port() const;

    const ScreenshotHandler& handler() const {
        return *handler_;
    }
    boost::asio::io_context& io_context() {
        return io_context_;
    }

private:
    boost::asio::awaitable<void> do_accept();

    std::shared_ptr<const ScreenshotHandler> handler_;
    std::string                              bind_ip_;
    int                                      bind_port_;
    int                                      thread_count_;
    int                                      port_ = 0;

    boost::asio::io_context        io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread>       threads_;
};

}  // namespace Server
}  // namespace Glimpse
