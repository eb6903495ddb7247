#pragma once
#include <string>

#include "../types/constants.hpp"
#include "glimpse/capture.hpp"

namespace Glimpse {
namespace Core {

struct Config {
    std::string bind_ip        = Constants::DEFAULT_BIND_IP;
    int         port           = Constants::DEFAULT_PORT;
    int         threads        = Constants::DEFAULT_THREADS;
    std::string allowed_origin = Constants::DEFAULT_ALLOWED_ORIGIN;

    std::string storage_path    = Constants::DEFAULT_STORAGE_PATH;
    int         timeout         = Constants::DEFAULT_TIMEOUT;  // seconds
    std::string user_agent      = Constants::DEFAULT_USER_AGENT;
    bool        disable_sandbox = false;
    std::string browser_path;

    std::string config_path;
    bool        quiet = false;

    static Config parse(int argc, char* argv[]);

    // Capture settings derived from this config; immutable once handed out.
    Settings settings() const;

    void validate() const;
};

}  // namespace Core
}  // namespace Glimpse
