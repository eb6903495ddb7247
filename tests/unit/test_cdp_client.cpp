#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <vector>
#include "../../src/browser/cdp/cdp_client.hpp"
#include "../../src/browser/chrome_page.hpp"
#include "../../src/capture/page_capture.hpp"
#include "../fakes/fake_browser.hpp"
#include "../../src/utils/text/string_utils.hpp"
#include "glimpse/errors.hpp"

using namespace Glimpse;
using namespace Glimpse::Browser::CDP;
using nlohmann::json;

namespace net       = boost::asio;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp           = net::ip::tcp;

namespace {

// Minimal DevTools page endpoint: accepts one websocket client and answers
// each command with whatever the script returns for it.
class FakeDevTools {
public:
    using Script = std::function<std::vector<json>(const json&)>;

    FakeDevTools(net::io_context& io, Script script)
        : acceptor_(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
          script_(std::move(script)) {
    }

    int port() const {
        return acceptor_.local_endpoint().port();
    }

    std::string ws_url() const {
        return "ws://127.0.0.1:" + std::to_string(port()) + "/devtools/page/FAKE";
    }

    const std::vector<json>& received() const {
        return received_;
    }

    net::awaitable<void> serve() {
        try {
            auto socket = co_await acceptor_.async_accept(net::use_awaitable);
            websocket::stream<beast::tcp_stream> ws(std::move(socket));
            co_await ws.async_accept(net::use_awaitable);

            while (true) {
                beast::flat_buffer buffer;
                co_await ws.async_read(buffer, net::use_awaitable);
                json command = json::parse(beast::buffers_to_string(buffer.data()));
                received_.push_back(command);

                for (const auto& reply : script_(command)) {
                    ws.text(true);
                    co_await ws.async_write(net::buffer(reply.dump()), net::use_awaitable);
                }
            }
        } catch (const boost::system::system_error&) {
            // Client went away.
        }
    }

private:
    tcp::acceptor     acceptor_;
    Script            script_;
    std::vector<json> received_;
};

json reply(const json& command, json result) {
    return {{"id", command["id"]}, {"result", std::move(result)}};
}

// Answers Page.enable and Page.navigate; fires the load event unless told not to.
FakeDevTools::Script navigation_script(bool fire_load_event, const std::string& error_text = "") {
    return [=](const json& command) -> std::vector<json> {
        std::string method = command["method"].get<std::string>();
        if (method == "Page.navigate") {
            if (!error_text.empty())
                return {reply(command, {{"frameId", "F1"}, {"errorText", error_text}})};

            std::vector<json> out = {reply(command, {{"frameId", "F1"}, {"loaderId", "L1"}})};
            if (fire_load_event) {
                out.push_back({{"method", "Page.frameStartedLoading"}, {"params", json::object()}});
                out.push_back(
                    {{"method", "Page.loadEventFired"}, {"params", {{"timestamp", 1.0}}}});
            }
            return out;
        }
        return {reply(command, json::object())};
    };
}

// Connects a client to the fake endpoint, runs body, and drives both sides
// to completion.
template <typename T>
T with_client(FakeDevTools::Script                                 script,
              std::function<net::awaitable<T>(CDPClient&)>         body,
              std::vector<json>*                                   received = nullptr) {
    net::io_context io;
    FakeDevTools    devtools(io, std::move(script));
    net::co_spawn(io, devtools.serve(), net::detached);

    auto future = net::co_spawn(
        io,
        [&]() -> net::awaitable<T> {
            auto client = std::make_shared<CDPClient>(co_await net::this_coro::executor,
                                                      "127.0.0.1", devtools.port());
            co_await client->connect(devtools.ws_url());

            // Closing stops the reader, which lets io.run() return.
            T                  value{};
            std::exception_ptr failure;
            try {
                value = co_await body(*client);
            } catch (...) {
                failure = std::current_exception();
            }
            client->close();
            if (failure)
                std::rethrow_exception(failure);
            co_return value;
        },
        net::use_future);

    io.run();
    if (received)
        *received = devtools.received();
    return future.get();
}

}  // namespace

TEST(CDPClientTest, NavigateWaitsForLoadEvent) {
    std::vector<json> received;
    bool              done = with_client<bool>(
        navigation_script(true),
        [](CDPClient& client) -> net::awaitable<bool> {
            co_await client.navigate("https://example.com");
            co_return true;
        },
        &received);

    EXPECT_TRUE(done);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0]["method"], "Page.enable");
    EXPECT_EQ(received[1]["method"], "Page.navigate");
    EXPECT_EQ(received[1]["params"]["url"], "https://example.com");
}

TEST(CDPClientTest, NavigateErrorTextIsNavigationError) {
    auto body = [](CDPClient& client) -> net::awaitable<bool> {
        co_await client.navigate("https://unreachable.invalid");
        co_return true;
    };

    EXPECT_THROW(with_client<bool>(navigation_script(true, "net::ERR_NAME_NOT_RESOLVED"), body),
                 NavigationError);
}

TEST(CDPClientTest, MissingLoadEventIsNavigationTimeout) {
    auto body = [](CDPClient& client) -> net::awaitable<bool> {
        client.set_timeout(std::chrono::seconds(1));
        co_await client.navigate("https://slow.example.com");
        co_return true;
    };

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(with_client<bool>(navigation_script(false), body), NavigationTimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(CDPClientTest, EvaluateReturnsValue) {
    auto script = [](const json& command) -> std::vector<json> {
        EXPECT_EQ(command["method"], "Runtime.evaluate");
        EXPECT_TRUE(command["params"]["returnByValue"].get<bool>());
        return {reply(command, {{"result", {{"type", "number"}, {"value", 820}}}})};
    };

    json value = with_client<json>(script, [](CDPClient& client) -> net::awaitable<json> {
        co_return co_await client.evaluate("document.body.scrollHeight");
    });

    EXPECT_EQ(value, 820);
}

TEST(CDPClientTest, EvaluateWithoutValueIsNull) {
    auto script = [](const json& command) -> std::vector<json> {
        return {reply(command, {{"result", {{"type", "undefined"}}}})};
    };

    json value = with_client<json>(script, [](CDPClient& client) -> net::awaitable<json> {
        co_return co_await client.evaluate("undefined");
    });

    EXPECT_TRUE(value.is_null());
}

TEST(CDPClientTest, EvaluateExceptionIsScriptEvaluationError) {
    auto script = [](const json& command) -> std::vector<json> {
        return {reply(command,
                      {{"result", {{"type", "object"}, {"subtype", "error"}}},
                       {"exceptionDetails", {{"text", "Uncaught TypeError"}}}})};
    };
    auto body = [](CDPClient& client) -> net::awaitable<json> {
        co_return co_await client.evaluate("document.body.scrollHeight");
    };

    EXPECT_THROW(with_client<json>(script, body), ScriptEvaluationError);
}

TEST(CDPClientTest, ScreenshotIsDecoded) {
    std::string png    = {(char)0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0x00, (char)0xFF};
    auto        script = [&](const json& command) -> std::vector<json> {
        EXPECT_EQ(command["method"], "Page.captureScreenshot");
        EXPECT_EQ(command["params"]["format"], "png");
        return {reply(command, {{"data", Utils::Text::base64_encode(png)}})};
    };

    std::string bytes =
        with_client<std::string>(script, [](CDPClient& client) -> net::awaitable<std::string> {
            co_return co_await client.capture_screenshot();
        });

    EXPECT_EQ(bytes, png);
}

TEST(CDPClientTest, ProtocolErrorOnViewportIsCaptureError) {
    auto script = [](const json& command) -> std::vector<json> {
        return {{{"id", command["id"]},
                 {"error", {{"code", -32602}, {"message", "Invalid parameters"}}}}};
    };
    auto body = [](CDPClient& client) -> net::awaitable<bool> {
        co_await client.set_device_metrics(-1, 600);
        co_return true;
    };

    EXPECT_THROW(with_client<bool>(script, body), CaptureError);
}

TEST(CDPClientTest, ResponsesMatchedById) {
    // An unrelated event arrives ahead of every reply.
    auto script = [](const json& command) -> std::vector<json> {
        return {{{"method", "Runtime.consoleAPICalled"}, {"params", json::object()}},
                reply(command, {{"result", {{"type", "string"}, {"value", "ok"}}}})};
    };

    json value = with_client<json>(script, [](CDPClient& client) -> net::awaitable<json> {
        json first = co_await client.evaluate("'ok'");
        json again = co_await client.evaluate("'ok'");
        co_return json::array({first, again});
    });

    EXPECT_EQ(value, json::array({"ok", "ok"}));
}

TEST(CDPClientTest, UnreachableEndpointIsBrowserStartError) {
    net::io_context io;
    // Grab a free port and release it so nothing listens there.
    int port = 0;
    {
        tcp::acceptor reserved(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = reserved.local_endpoint().port();
    }

    auto future = net::co_spawn(
        io,
        [port]() -> net::awaitable<void> {
            auto client =
                std::make_shared<CDPClient>(co_await net::this_coro::executor, "127.0.0.1", port);
            co_await client->connect("ws://127.0.0.1:" + std::to_string(port) + "/devtools/page/X");
        },
        net::use_future);
    io.run();

    EXPECT_THROW(future.get(), BrowserStartError);
}

TEST(CDPClientTest, LateReplyIsDroppedAndConnectionSurvivesTimeout) {
    // The first evaluate is answered only after the second one is sent.
    std::vector<json> held;
    auto              script = [&](const json& command) -> std::vector<json> {
        if (command["params"]["expression"] == "'slow'") {
            held.push_back(reply(command, {{"result", {{"type", "string"}, {"value", "slow"}}}}));
            return {};
        }
        std::vector<json> out = held;
        held.clear();
        out.push_back(reply(command, {{"result", {{"type", "string"}, {"value", "fast"}}}}));
        return out;
    };

    json value = with_client<json>(script, [](CDPClient& client) -> net::awaitable<json> {
        client.set_timeout(std::chrono::seconds(1));
        bool timed_out = false;
        try {
            co_await client.evaluate("'slow'");
        } catch (const ScriptEvaluationError&) {
            timed_out = true;
        }
        json next = co_await client.evaluate("'fast'");
        co_return json::array({timed_out, next});
    });

    EXPECT_EQ(value, json::array({true, "fast"}));
}

namespace {

// Session over a live DevTools connection without a browser process.
class ConnectedSession : public Browser::Session {
public:
    explicit ConnectedSession(std::shared_ptr<CDPClient> cdp) : cdp_(cdp), page_(cdp) {
    }

    Browser::Page& page() override {
        return page_;
    }

    void terminate() override {
        cdp_->close();
    }

private:
    std::shared_ptr<CDPClient> cdp_;
    Browser::ChromePage        page_;
};

}  // namespace

TEST(CDPClientTest, UnansweredHeightScriptFallsBackOnSameConnection) {
    std::string png    = {(char)0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    auto        script = [&](const json& command) -> std::vector<json> {
        std::string method = command["method"].get<std::string>();
        if (method == "Runtime.evaluate")
            return {};
        if (method == "Page.captureScreenshot")
            return {reply(command, {{"data", Utils::Text::base64_encode(png)}})};
        return navigation_script(true)(command);
    };

    net::io_context io;
    FakeDevTools    devtools(io, script);
    net::co_spawn(io, devtools.serve(), net::detached);

    auto state   = std::make_shared<Testing::FakeBrowserState>();
    auto capture = Capture::PageCapture(std::chrono::seconds(1),
                                        std::make_shared<Testing::FakeSleeper>(state));

    auto future = net::co_spawn(
        io,
        [&]() -> net::awaitable<std::string> {
            auto cdp = std::make_shared<CDPClient>(co_await net::this_coro::executor,
                                                   "127.0.0.1", devtools.port());
            co_await cdp->connect(devtools.ws_url());

            Capture::SessionHandle session(std::make_unique<ConnectedSession>(cdp));
            CaptureRequest         request;
            request.url       = "https://example.com";
            request.full_page = true;
            co_return co_await capture.capture(session, request);
        },
        net::use_future);

    io.run();
    EXPECT_EQ(future.get(), png);

    std::vector<json> viewports;
    for (const auto& command : devtools.received())
        if (command["method"] == "Emulation.setDeviceMetricsOverride")
            viewports.push_back(command["params"]);
    ASSERT_EQ(viewports.size(), 2u);
    EXPECT_EQ(viewports[0]["height"], 768);
    EXPECT_EQ(viewports[1]["width"], 1024);
    EXPECT_EQ(viewports[1]["height"], 768);
    EXPECT_EQ(devtools.received().back()["method"], "Page.captureScreenshot");
}
