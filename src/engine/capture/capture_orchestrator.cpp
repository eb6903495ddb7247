#include "capture_orchestrator.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/filename/filename.hpp"
#include "glimpse/errors.hpp"

namespace Glimpse {
namespace Engine {

using namespace Glimpse::Core;

CaptureOrchestrator::CaptureOrchestrator(Settings                          settings,
                                         std::shared_ptr<Browser::Driver>  driver,
                                         std::shared_ptr<Storage::Storage> storage,
                                         std::shared_ptr<Capture::Sleeper> sleeper,
                                         FilenameGenerator                 generate_filename)
    : settings_(std::move(settings)),
      sessions_(std::move(driver)),
      page_capture_(std::chrono::seconds(settings_.timeout_seconds), std::move(sleeper)),
      storage_(std::move(storage)),
      generate_filename_(generate_filename ? std::move(generate_filename)
                                           : FilenameGenerator(&Utils::Filename::generate)) {
}

boost::asio::awaitable<CaptureResult>
CaptureOrchestrator::capture(const CaptureRequest& request) const {
    co_return co_await capture(request, generate_filename_());
}

boost::asio::awaitable<CaptureResult>
CaptureOrchestrator::capture(const CaptureRequest& request, const std::string& filename) const {
    auto config = Browser::BrowserConfig::from(request, settings_);

    Logger::info("Capture: Starting browser for " + request.url + " ("
                 + std::to_string(config.width) + "x" + std::to_string(config.height)
                 + (request.full_page ? ", full page" : "") + ")");

    // From here on every exit path tears the browser down: explicitly after
    // persisting, or through the handle's destructor when anything throws.
    Capture::SessionHandle session = co_await sessions_.acquire(config);

    std::string bytes = co_await page_capture_.capture(session, request);
    std::string path  = storage_->persist(bytes, filename, settings_.storage_directory);

    sessions_.release(session);

    Logger::success("Capture: " + request.url + " -> " + path + " ("
                    + std::to_string(bytes.size()) + " bytes)");
    co_return CaptureResult(request, std::move(path), std::move(bytes));
}

}  // namespace Engine
}  // namespace Glimpse
