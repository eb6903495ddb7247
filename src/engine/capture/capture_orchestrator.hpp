#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <string>

#include "../../browser/driver.hpp"
#include "../../capture/browser_session.hpp"
#include "../../capture/page_capture.hpp"
#include "../../capture/sleeper.hpp"
#include "../../storage/storage.hpp"
#include "glimpse/capture.hpp"

namespace Glimpse {
namespace Engine {

// Runs one capture end to end: start a browser, capture the page, persist
// the image, stop the browser. Holds no mutable state, so one instance can
// serve concurrent requests; each request launches its own browser.
class CaptureOrchestrator {
public:
    using FilenameGenerator = std::function<std::string()>;

    CaptureOrchestrator(Settings                          settings,
                        std::shared_ptr<Browser::Driver>  driver,
                        std::shared_ptr<Storage::Storage> storage,
                        std::shared_ptr<Capture::Sleeper> sleeper,
                        FilenameGenerator                 generate_filename = nullptr);

    boost::asio::awaitable<CaptureResult> capture(const CaptureRequest& request) const;
    boost::asio::awaitable<CaptureResult> capture(const CaptureRequest& request,
                                                  const std::string&    filename) const;

    const Settings& settings() const {
        return settings_;
    }

private:
    const Settings                    settings_;
    Capture::BrowserSession           sessions_;
    Capture::PageCapture              page_capture_;
    std::shared_ptr<Storage::Storage> storage_;
    FilenameGenerator                 generate_filename_;
};

}  // namespace Engine
}  // namespace Glimpse
