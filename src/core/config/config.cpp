#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Glimpse {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["bind_ip"])
            config.bind_ip = yaml["bind_ip"].as<std::string>();
        if (yaml["port"])
            config.port = yaml["port"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["allowed_origin"])
            config.allowed_origin = yaml["allowed_origin"].as<std::string>();
        if (yaml["browser_path"])
            config.browser_path = yaml["browser_path"].as<std::string>();

        if (yaml["storage_path"])
            config.storage_path = yaml["storage_path"].as<std::string>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<int>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["disable_sandbox"])
            config.disable_sandbox = yaml["disable_sandbox"].as<bool>();

        // Nested layout: storage.path, screenshot.{timeout,user_agent,disable_sandbox}
        YAML::Node storage = yaml["storage"];
        if (storage && storage.IsMap() && storage["path"])
            config.storage_path = storage["path"].as<std::string>();

        YAML::Node screenshot = yaml["screenshot"];
        if (screenshot && screenshot.IsMap()) {
            if (screenshot["timeout"])
                config.timeout = screenshot["timeout"].as<int>();
            if (screenshot["user_agent"])
                config.user_agent = screenshot["user_agent"].as<std::string>();
            if (screenshot["disable_sandbox"])
                config.disable_sandbox = screenshot["disable_sandbox"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Glimpse - Headless Browser Screenshot Service"};

    app.add_option("--bind-ip", config.bind_ip, "HTTP server bind IP");
    app.add_option("--port", config.port, "HTTP server port");
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("--allowed-origin", config.allowed_origin, "CORS origin allowed to POST");
    app.add_option("-o,--storage-path", config.storage_path, "Directory screenshots are saved to");
    app.add_option("--timeout", config.timeout, "Page load timeout in seconds");
    app.add_option("--user-agent", config.user_agent, "User agent reported by the browser");
    app.add_option("--browser", config.browser_path, "Path to Chromium/Chrome executable");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag("--disable-sandbox",
                 config.disable_sandbox,
                 "Run Chromium without its sandbox (containers only)");
    app.add_flag("-q,--quiet", config.quiet, "Only log errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (timeout <= 0)
        throw std::runtime_error("timeout must be a positive number of seconds");
    if (port < 0 || port > 65535)
        throw std::runtime_error("port out of range: " + std::to_string(port));
    if (threads <= 0)
        throw std::runtime_error("threads must be positive");
    if (storage_path.empty())
        throw std::runtime_error("storage path must not be empty");
}

Settings Config::settings() const {
    Settings settings;
    settings.storage_directory = storage_path;
    settings.timeout_seconds   = timeout;
    settings.user_agent        = user_agent;
    settings.disable_sandbox   = disable_sandbox;
    settings.browser_path      = browser_path;
    return settings;
}

}  // namespace Core
}  // namespace Glimpse
