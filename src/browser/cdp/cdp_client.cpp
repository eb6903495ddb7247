#include "cdp_client.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <curl/curl.h>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"
#include "glimpse/errors.hpp"

namespace Glimpse {
namespace Browser {
namespace CDP {

using namespace Glimpse::Core;
using nlohmann::json;

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CDPClient::CDPClient(net::any_io_executor executor, const std::string& host, int port)
    : host_(host), port_(port), ws_(executor), arrival_(executor) {
}

CDPClient::~CDPClient() {
    close();
}

std::string CDPClient::get_web_socket_url() {
    CURL* curl = curl_easy_init();
    if (!curl)
        throw BrowserStartError("curl_easy_init failed");

    std::string readBuffer;
    std::string url = "http://" + host_ + ":" + std::to_string(port_) + "/json/new?about:blank";
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(Constants::BROWSER_START_TIMEOUT.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc     = curl_easy_perform(curl);
    long     status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK)
        throw BrowserStartError("DevTools endpoint unreachable: "
                                + std::string(curl_easy_strerror(rc)));
    if (status != 200)
        throw BrowserStartError("DevTools refused to open a tab (HTTP " + std::to_string(status)
                                + ")");

    auto j = json::parse(readBuffer, nullptr, false);
    if (j.is_discarded() || !j.contains("webSocketDebuggerUrl"))
        throw BrowserStartError("Malformed /json/new response: " + readBuffer);

    tab_id_ = j.value("id", "");
    return j["webSocketDebuggerUrl"].get<std::string>();
}

net::awaitable<void> CDPClient::connect() {
    std::string ws_url = get_web_socket_url();
    co_await    connect(ws_url);
}

net::awaitable<void> CDPClient::connect(const std::string& ws_url) {
    if (!Utils::Text::starts_with(ws_url, "ws://"))
        throw BrowserStartError("Unsupported DevTools URL: " + ws_url);

    auto        parsed = Utils::Url::parse(ws_url);
    std::string host   = parsed.host.empty() ? host_ : parsed.host;
    std::string port   = parsed.port.empty() ? std::to_string(port_) : parsed.port;

    try {
        tcp::resolver resolver(ws_.get_executor());
        auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

        beast::get_lowest_layer(ws_).expires_after(Constants::BROWSER_START_TIMEOUT);
        co_await beast::get_lowest_layer(ws_).async_connect(results, net::use_awaitable);

        ws_.read_message_max(Constants::MAX_CDP_MESSAGE);
        co_await ws_.async_handshake(host + ":" + port, parsed.path, net::use_awaitable);
        beast::get_lowest_layer(ws_).expires_never();
    } catch (const boost::system::system_error& e) {
        throw BrowserStartError("CDP connection to " + ws_url + " failed: " + e.what());
    }

    connected_ = true;
    read_error_.clear();
    net::co_spawn(
        ws_.get_executor(), [self = shared_from_this()]() { return self->read_loop(); },
        net::detached);
}

net::awaitable<json>
CDPClient::call(const std::string& method, json params, Clock::time_point deadline) {
    if (!connected_)
        throw CommandError(method, closed_reason());

    int  id  = current_id_++;
    json msg = {{"id", id}, {"method", method}, {"params", std::move(params)}};

    try {
        co_await send_message(msg);
    } catch (const boost::system::system_error& e) {
        close();
        throw CommandError(method, e.what());
    }

    std::optional<json> response = co_await wait_for_id(id, deadline);
    if (!response) {
        if (!connected_)
            throw CommandError(method, closed_reason());
        // A late reply is dropped by the reader instead of piling up.
        abandoned_.insert(id);
        throw CommandError(method, "no response before the deadline", true);
    }

    if (response->contains("error")) {
        const auto& err = (*response)["error"];
        throw CommandError(method, err.is_object() ? err.value("message", err.dump()) : err.dump());
    }
    co_return response->contains("result") ? (*response)["result"] : json::object();
}

net::awaitable<void> CDPClient::set_device_metrics(int width, int height) {
    json params = {
        {"width", width}, {"height", height}, {"deviceScaleFactor", 1}, {"mobile", false}};
    try {
        co_await call("Emulation.setDeviceMetricsOverride", params, Clock::now() + timeout_);
    } catch (const CommandError& e) {
        throw CaptureError("Cannot set viewport to " + std::to_string(width) + "x"
                           + std::to_string(height) + ": " + e.what());
    }
}

// Page load and readiness share one deadline.
net::awaitable<void> CDPClient::navigate(const std::string& url) {
    auto deadline = Clock::now() + timeout_;
    try {
        co_await call("Page.enable", json::object(), deadline);
        events_.clear();

        json result = co_await call("Page.navigate", {{"url", url}}, deadline);

        std::string error_text = result.value("errorText", "");
        if (!error_text.empty())
            throw NavigationError("Navigation to " + url + " failed: " + error_text);

        // Same-document navigations carry no loaderId and fire no load event.
        if (result.contains("loaderId")) {
            auto loaded = co_await wait_for_event("Page.loadEventFired", deadline);
            if (!loaded) {
                if (!connected_)
                    throw CommandError("Page.loadEventFired", closed_reason());
                throw CommandError("Page.loadEventFired", "no load event before the deadline", true);
            }
        }
    } catch (const CommandError& e) {
        if (e.timed_out()) {
            Logger::warn("CDP: Page load timed out: " + url);
            throw NavigationTimeoutError("Page load timed out after "
                                         + std::to_string(timeout_.count()) + "s: " + url);
        }
        throw NavigationError("Navigation to " + url + " failed: " + e.what());
    }
}

net::awaitable<json> CDPClient::evaluate(const std::string& expression) {
    json result;
    try {
        result = co_await call("Runtime.evaluate",
                               {{"expression", expression}, {"returnByValue", true}},
                               Clock::now() + timeout_);
    } catch (const CommandError& e) {
        throw ScriptEvaluationError(e.what());
    }

    if (result.contains("exceptionDetails")) {
        const auto& details = result["exceptionDetails"];
        throw ScriptEvaluationError("Script threw: " + details.value("text", details.dump()));
    }

    const json remote = result.value("result", json::object());
    co_return remote.contains("value") ? remote["value"] : json();
}

net::awaitable<std::string> CDPClient::capture_screenshot() {
    json result;
    try {
        result = co_await call("Page.captureScreenshot", {{"format", "png"}}, Clock::now() + timeout_);
    } catch (const CommandError& e) {
        throw CaptureError(std::string("Screenshot failed: ") + e.what());
    }

    std::string bytes = Utils::Text::base64_decode(result.value("data", ""));
    if (bytes.empty())
        throw CaptureError("Browser returned an empty screenshot");
    co_return bytes;
}

void CDPClient::close() {
    auto& stream = beast::get_lowest_layer(ws_);
    if (stream.socket().is_open())
        stream.close();
    connected_ = false;
    arrival_.cancel();
}

net::awaitable<void> CDPClient::send_message(const json& msg) {
    std::string payload = msg.dump();
    ws_.text(true);
    co_await ws_.async_write(net::buffer(payload), net::use_awaitable);
}

net::awaitable<json> CDPClient::read_message() {
    beast::flat_buffer buffer;
    co_await           ws_.async_read(buffer, net::use_awaitable);
    co_return json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
}

net::awaitable<void> CDPClient::read_loop() {
    try {
        while (true) {
            json msg = co_await read_message();
            if (msg.is_discarded())
                continue;
            dispatch(std::move(msg));
            arrival_.cancel();
        }
    } catch (const boost::system::system_error& e) {
        if (connected_ && e.code() != net::error::operation_aborted)
            Logger::warn(std::string("CDP: connection lost: ") + e.what());
        read_error_ = e.code();
    }
    connected_ = false;
    arrival_.cancel();
}

void CDPClient::dispatch(json msg) {
    if (msg.contains("id")) {
        int id = msg["id"].get<int>();
        if (abandoned_.erase(id) == 0)
            responses_[id] = std::move(msg);
    }
    else if (msg.contains("method")) {
        events_.push_back(std::move(msg));
    }
}

// Wakes on the next message from the reader, on close, or at the deadline.
net::awaitable<void> CDPClient::wait_for_arrival(Clock::time_point deadline) {
    boost::system::error_code ec;
    arrival_.expires_at(deadline);
    co_await arrival_.async_wait(net::redirect_error(net::use_awaitable, ec));
}

net::awaitable<std::optional<json>> CDPClient::wait_for_id(int id, Clock::time_point deadline) {
    while (true) {
        auto it = responses_.find(id);
        if (it != responses_.end()) {
            json msg = std::move(it->second);
            responses_.erase(it);
            co_return msg;
        }
        if (!connected_ || Clock::now() >= deadline)
            co_return std::nullopt;
        co_await wait_for_arrival(deadline);
    }
}

net::awaitable<std::optional<json>> CDPClient::wait_for_event(const std::string& method,
                                                             Clock::time_point  deadline) {
    while (true) {
        for (auto it = events_.begin(); it != events_.end(); ++it) {
            if (it->value("method", "") == method) {
                json event = std::move(*it);
                events_.erase(it);
                co_return event;
            }
        }
        if (!connected_ || Clock::now() >= deadline)
            co_return std::nullopt;
        co_await wait_for_arrival(deadline);
    }
}

std::string CDPClient::closed_reason() const {
    if (read_error_)
        return "connection closed: " + read_error_.message();
    return "not connected";
}

}  // namespace CDP
}  // namespace Browser
}  // namespace Glimpse
