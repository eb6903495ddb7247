#include "http_server.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "connection.hpp"

namespace Glimpse {
namespace Server {

using namespace Glimpse::Core;

HttpServer::HttpServer(std::shared_ptr<const ScreenshotHandler> handler,
                       const std::string&                       bind_ip,
                       int                                      bind_port,
                       int                                      thread_count)
    : handler_(std::move(handler)),
      bind_ip_(bind_ip),
      bind_port_(bind_port),
      thread_count_(thread_count),
      acceptor_(io_context_) {
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    try {
        boost::asio::ip::tcp::resolver resolver(io_context_);
        boost::asio::ip::tcp::endpoint endpoint =
            *resolver.resolve(bind_ip_, std::to_string(bind_port_)).begin();

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (const std::exception& e) {
        throw std::runtime_error("HttpServer: Cannot listen on " + bind_ip_ + ":"
                                 + std::to_string(bind_port_) + ": " + e.what());
    }

    port_ = acceptor_.local_endpoint().port();
    Logger::info("HttpServer: Listening on " + bind_ip_ + ":" + std::to_string(port_) + " with "
                 + std::to_string(thread_count_) + " threads");

    boost::asio::co_spawn(io_context_, do_accept(), boost::asio::detached);

    for (int i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
}

void HttpServer::stop() {
    if (!io_context_.stopped()) {
        io_context_.stop();
    }
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
    threads_.clear();
}

int HttpServer::get_port() const {
    return port_;
}

boost::asio::awaitable<void> HttpServer::do_accept() {
    while (acceptor_.is_open()) {
        try {
            auto socket = co_await acceptor_.async_accept(boost::asio::use_awaitable);
            std::make_shared<Connection>(std::move(socket), this)->start();
        } catch (const boost::system::system_error& e) {
            if (e.code() == boost::asio::error::operation_aborted)
                break;
            Logger::error("HttpServer: Accept error: " + std::string(e.what()));
        }
    }
}

}  // namespace Server
}  // namespace Glimpse
