#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include "../browser/driver.hpp"

namespace Glimpse {
namespace Capture {

// Move-only owner of one running browser. The browser is terminated exactly
// once: by release() or, failing that, by the destructor.
class SessionHandle {
public:
    SessionHandle() = default;
    explicit SessionHandle(std::unique_ptr<Browser::Session> session);
    ~SessionHandle();

    SessionHandle(SessionHandle&& other) noexcept            = default;
    SessionHandle& operator=(SessionHandle&& other) noexcept;
    SessionHandle(const SessionHandle&)                      = delete;
    SessionHandle& operator=(const SessionHandle&)           = delete;

    Browser::Page& page();
    bool           active() const {
        return session_ != nullptr;
    }

    void release();

private:
    std::unique_ptr<Browser::Session> session_;
};

class BrowserSession {
public:
    explicit BrowserSession(std::shared_ptr<Browser::Driver> driver);

    // Throws BrowserStartError.
    boost::asio::awaitable<SessionHandle> acquire(const Browser::BrowserConfig& config) const;

    void release(SessionHandle& handle) const;

private:
    std::shared_ptr<Browser::Driver> driver_;
};

}  // namespace Capture
}  // namespace Glimpse
