#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../browser_config.hpp"

namespace Glimpse {
namespace Browser {
namespace Launcher {

// Owns one Chromium process group and its throwaway profile directory.
class BrowserProcess {
public:
    BrowserProcess(pid_t pid, std::string user_data_dir);
    ~BrowserProcess();

    BrowserProcess(const BrowserProcess&)            = delete;
    BrowserProcess& operator=(const BrowserProcess&) = delete;

    pid_t pid() const {
        return pid_;
    }
    int devtools_port() const {
        return devtools_port_;
    }
    const std::string& user_data_dir() const {
        return user_data_dir_;
    }

    void terminate();

private:
    friend class BrowserLauncher;

    pid_t       pid_;
    int         devtools_port_ = 0;
    std::string user_data_dir_;
};

class BrowserLauncher {
public:
    static std::string find_browser();

    // Starts the browser and waits for its DevTools endpoint.
    // Throws BrowserStartError.
    static std::unique_ptr<BrowserProcess>
    launch(const BrowserConfig&      config,
           std::chrono::milliseconds startup_timeout = Core::Constants::BROWSER_START_TIMEOUT);

private:
    static std::vector<std::string> get_search_paths();
    static std::string              make_user_data_dir();
    static int                      wait_for_devtools_port(BrowserProcess&           process,
                                                           std::chrono::milliseconds timeout);
};

}  // namespace Launcher
}  // namespace Browser
}  // namespace Glimpse
