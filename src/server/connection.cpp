#include "connection.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http.hpp>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "http_server.hpp"

namespace Glimpse {
namespace Server {

using namespace Glimpse::Core;

namespace beast = boost::beast;
namespace http  = beast::http;

Connection::Connection(boost::asio::ip::tcp::socket socket, HttpServer* server)
    : stream_(std::move(socket)), server_(server) {
}

Connection::~Connection() {
    close();
}

// The strand serializes the request coroutine with the DevTools reader it
// spawns, since the io_context runs on several threads.
void Connection::start() {
    boost::asio::co_spawn(
        boost::asio::make_strand(server_->io_context()),
        [self = shared_from_this()]() { return self->start_impl(); },
        boost::asio::detached);
}

void Connection::close() {
    beast::error_code ec;
    if (stream_.socket().is_open()) {
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }
}

boost::asio::awaitable<void> Connection::start_impl() {
    beast::flat_buffer buffer;
    try {
        while (true) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(Constants::MAX_REQUEST_BODY);

            stream_.expires_after(kReadTimeout);
            co_await http::async_read(stream_, buffer, parser, boost::asio::use_awaitable);
            Request req = parser.release();

            // Captures may legitimately outlast the read timeout.
            stream_.expires_never();
            Logger::info("HTTP " + std::string(req.method_string()) + " "
                         + std::string(req.target()));

            Response res        = co_await server_->handler().handle(req);
            bool     keep_alive = res.keep_alive();
            co_await http::async_write(stream_, res, boost::asio::use_awaitable);

            if (!keep_alive)
                break;
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != http::error::end_of_stream && e.code() != beast::error::timeout
            && e.code() != boost::asio::error::operation_aborted)
            Logger::warn("HTTP connection error: " + std::string(e.what()));
    }
    close();
}

}  // namespace Server
}  // namespace Glimpse
