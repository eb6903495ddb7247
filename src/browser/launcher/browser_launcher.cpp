#include "browser_launcher.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>
#include <utility>
#include <sys/wait.h>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "glimpse/errors.hpp"

namespace Glimpse {
namespace Browser {
namespace Launcher {

using namespace Glimpse::Core;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

bool reap(pid_t pid, int* status) {
    pid_t r = waitpid(pid, status, WNOHANG);
    return r == pid || (r < 0 && errno == ECHILD);
}

}  // namespace

BrowserProcess::BrowserProcess(pid_t pid, std::string user_data_dir)
    : pid_(pid), user_data_dir_(std::move(user_data_dir)) {
}

BrowserProcess::~BrowserProcess() {
    terminate();
}

void BrowserProcess::terminate() {
    if (pid_ > 0) {
        Logger::info("Closing headless browser (PID: " + std::to_string(pid_) + ")...");

        // The child leads its own group, so renderers and zygotes go with it.
        kill(-pid_, SIGTERM);

        int  status   = 0;
        bool exited   = reap(pid_, &status);
        auto deadline = std::chrono::steady_clock::now() + Constants::BROWSER_STOP_TIMEOUT;
        while (!exited && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kPollInterval);
            exited = reap(pid_, &status);
        }
        if (!exited) {
            Logger::warn("Browser ignored SIGTERM, killing PID " + std::to_string(pid_));
            kill(-pid_, SIGKILL);
            waitpid(pid_, &status, 0);
        }
        pid_ = -1;
    }

    if (!user_data_dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(user_data_dir_, ec);
        if (ec)
            Logger::warn("Failed to remove browser profile " + user_data_dir_ + ": " + ec.message());
        user_data_dir_.clear();
    }
}

std::vector<std::string> BrowserLauncher::get_search_paths() {
#ifdef __APPLE__
    return {"/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
            "/Applications/Chromium.app/Contents/MacOS/Chromium",
            "/opt/homebrew/bin/chromium",
            "/usr/local/bin/chromium",
            "/Applications/Microsoft Edge.app/Contents/MacOS/Microsoft Edge",
            "/usr/local/bin/chrome",
            "/usr/bin/google-chrome"};
#else
    return {"/usr/bin/google-chrome",
            "/usr/bin/google-chrome-stable",
            "/usr/bin/chromium-browser",
            "/usr/bin/chromium",
            "/snap/bin/chromium",
            "/usr/local/bin/chromium",
            "/opt/google/chrome/chrome"};
#endif
}

std::string BrowserLauncher::find_browser() {
    for (const auto& path : get_search_paths()) {
        if (std::filesystem::exists(path))
            return path;
    }
    return "";
}

std::string BrowserLauncher::make_user_data_dir() {
    static std::atomic<unsigned> counter{0};

    auto dir = std::filesystem::temp_directory_path()
               / ("glimpse_browser_" + std::to_string(getpid()) + "_"
                  + std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(dir);
    return dir.string();
}

std::unique_ptr<BrowserProcess> BrowserLauncher::launch(const BrowserConfig&      config,
                                                        std::chrono::milliseconds startup_timeout) {
    std::string path = config.executable.empty() ? find_browser() : config.executable;
    if (path.empty())
        throw BrowserStartError("No Chromium browser found. Use --browser to specify path.");
    if (!std::filesystem::exists(path))
        throw BrowserStartError("Browser path does not exist: " + path);

    std::string user_data_path;
    try {
        user_data_path = make_user_data_dir();
    } catch (const std::filesystem::filesystem_error& e) {
        throw BrowserStartError("Cannot create browser profile directory: "
                                + std::string(e.what()));
    }

    std::vector<std::string> arg_strings = {path};
    for (auto& arg : config.arguments())
        arg_strings.push_back(std::move(arg));
    arg_strings.push_back("--remote-debugging-port=0");
    arg_strings.push_back("--remote-allow-origins=*");
    arg_strings.push_back("--user-data-dir=" + user_data_path);
    arg_strings.push_back("about:blank");

    std::vector<const char*> args;
    for (const auto& s : arg_strings)
        args.push_back(s.c_str());
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::error_code ec;
        std::filesystem::remove_all(user_data_path, ec);
        throw BrowserStartError("fork() failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (freopen("/dev/null", "w", stdout) == NULL) {
        }
        if (freopen("/dev/null", "w", stderr) == NULL) {
        }
        execv(path.c_str(), const_cast<char* const*>(args.data()));
        _exit(127);
    }
    setpgid(pid, pid);

    auto process = std::make_unique<BrowserProcess>(pid, user_data_path);
    Logger::info("Launched headless browser: " + path + " (PID: " + std::to_string(pid) + ")");

    process->devtools_port_ = wait_for_devtools_port(*process, startup_timeout);
    return process;
}

// Chromium writes the port it picked for --remote-debugging-port=0 to the
// first line of <profile>/DevToolsActivePort.
int BrowserLauncher::wait_for_devtools_port(BrowserProcess&           process,
                                            std::chrono::milliseconds timeout) {
    auto port_file = std::filesystem::path(process.user_data_dir()) / "DevToolsActivePort";
    auto deadline  = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        if (reap(process.pid(), &status)) {
            process.pid_ = -1;
            int code     = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            throw BrowserStartError("Browser exited during startup (status "
                                    + std::to_string(code) + ")");
        }

        std::ifstream file(port_file);
        std::string   line;
        if (file && std::getline(file, line)) {
            line = Utils::Text::trim(line);
            if (!line.empty()) {
                try {
                    int port = std::stoi(line);
                    if (port > 0)
                        return port;
                } catch (const std::exception&) {
                    // Partially written file; try again on the next poll.
                }
            }
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    throw BrowserStartError("Timed out waiting for the DevTools endpoint");
}

}  // namespace Launcher
}  // namespace Browser
}  // namespace Glimpse
