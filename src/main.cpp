#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <curl/curl.h>
#include <memory>
#include <stdexcept>
#include "browser/browser.hpp"
#include "browser/launcher/browser_launcher.hpp"
#include "capture/sleeper.hpp"
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/types/constants.hpp"
#include "engine/capture/capture_orchestrator.hpp"
#include "server/http_server.hpp"
#include "server/screenshot_handler.hpp"
#include "storage/disk_storage.hpp"

using namespace Glimpse;
using namespace Glimpse::Core;

namespace {

void resolve_browser(Config& config) {
    if (!config.browser_path.empty())
        return;

    config.browser_path = Browser::Launcher::BrowserLauncher::find_browser();
    if (config.browser_path.empty())
        Logger::warn("No Chromium browser found. Captures will fail until --browser is given.");
    else
        Logger::info("Using browser: " + config.browser_path);
}

void wait_for_shutdown() {
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int signal) {
        Logger::info("Received signal " + std::to_string(signal) + ", shutting down...");
    });
    signals_context.run();
}

int run_server(Config config) {
    resolve_browser(config);

    auto orchestrator = std::make_shared<const Engine::CaptureOrchestrator>(
        config.settings(),
        std::make_shared<Browser::ChromeDriver>(),
        std::make_shared<Storage::DiskStorage>(),
        std::make_shared<Capture::TimerSleeper>());
    auto handler = std::make_shared<const Server::ScreenshotHandler>(orchestrator,
                                                                     config.allowed_origin);

    Server::HttpServer server(handler, config.bind_ip, config.port, config.threads);
    try {
        server.start();
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        return 1;
    }

    Logger::success("Glimpse " + std::string(Constants::VERSION) + " ready, saving to "
                    + config.storage_path);
    wait_for_shutdown();
    server.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.quiet)
        Logger::set_level(LOG_ERROR);

    curl_global_init(CURL_GLOBAL_ALL);
    int rc = run_server(config);
    curl_global_cleanup();

    return rc;
}
