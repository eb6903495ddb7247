#include "browser.hpp"
#include <utility>
#include <boost/asio/this_coro.hpp>
#include "cdp/cdp_client.hpp"
#include "chrome_page.hpp"
#include "launcher/browser_launcher.hpp"

namespace Glimpse {
namespace Browser {

using Launcher::BrowserLauncher;
using Launcher::BrowserProcess;

class ChromeSession : public Session {
public:
    ChromeSession(std::unique_ptr<BrowserProcess> process, std::shared_ptr<CDP::CDPClient> cdp)
        : process_(std::move(process)), cdp_(cdp), page_(cdp) {
    }

    ~ChromeSession() override {
        terminate();
    }

    Page& page() override {
        return page_;
    }

    void terminate() override {
        cdp_->close();
        process_->terminate();
    }

private:
    std::unique_ptr<BrowserProcess> process_;
    std::shared_ptr<CDP::CDPClient> cdp_;
    ChromePage                      page_;
};

boost::asio::awaitable<std::unique_ptr<Session>> ChromeDriver::launch(const BrowserConfig& config) {
    // Blocks this thread while Chromium starts up.
    auto process = BrowserLauncher::launch(config);

    auto executor = co_await boost::asio::this_coro::executor;
    auto cdp = std::make_shared<CDP::CDPClient>(executor, "127.0.0.1", process->devtools_port());
    co_await cdp->connect();

    co_return std::make_unique<ChromeSession>(std::move(process), cdp);
}

}  // namespace Browser
}  // namespace Glimpse
