#include "browser_session.hpp"
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "glimpse/errors.hpp"

namespace Glimpse {
namespace Capture {

using namespace Glimpse::Core;

SessionHandle::SessionHandle(std::unique_ptr<Browser::Session> session)
    : session_(std::move(session)) {
}

SessionHandle::~SessionHandle() {
    release();
}

SessionHandle& SessionHandle::operator=(SessionHandle&& other) noexcept {
    if (this != &other) {
        release();
        session_ = std::move(other.session_);
    }
    return *this;
}

Browser::Page& SessionHandle::page() {
    if (!session_)
        throw std::logic_error("Browser session already released");
    return session_->page();
}

void SessionHandle::release() {
    if (!session_)
        return;
    auto session = std::move(session_);
    try {
        session->terminate();
    } catch (const std::exception& e) {
        Logger::error("Failed to terminate browser session: " + std::string(e.what()));
    }
}

BrowserSession::BrowserSession(std::shared_ptr<Browser::Driver> driver)
    : driver_(std::move(driver)) {
}

boost::asio::awaitable<SessionHandle>
BrowserSession::acquire(const Browser::BrowserConfig& config) const {
    std::unique_ptr<Browser::Session> session;
    try {
        session = co_await driver_->launch(config);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw BrowserStartError(std::string("Browser launch failed: ") + e.what());
    }

    if (!session)
        throw BrowserStartError("Browser driver returned no session");
    co_return SessionHandle(std::move(session));
}

void BrowserSession::release(SessionHandle& handle) const {
    handle.release();
}

}  // namespace Capture
}  // namespace Glimpse
