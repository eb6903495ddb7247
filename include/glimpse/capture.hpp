#pragma once
#include <optional>
#include <string>
#include <utility>

namespace Glimpse {

struct CaptureDefaults {
    static constexpr int WIDTH         = 1024;
    static constexpr int HEIGHT        = 768;
    static constexpr int DELAY_SECONDS = 0;
};

// What a client asked for. Optional fields stay empty when the client left
// them out so the result can echo the request exactly.
struct CaptureRequest {
    std::string        url;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> delay_seconds;
    bool               full_page = false;

    int effective_width() const {
        return width.value_or(CaptureDefaults::WIDTH);
    }
    int effective_height() const {
        return height.value_or(CaptureDefaults::HEIGHT);
    }
    int effective_delay() const {
        return delay_seconds.value_or(CaptureDefaults::DELAY_SECONDS);
    }
};

class CaptureResult {
public:
    CaptureResult() = default;
    CaptureResult(CaptureRequest request, std::string storage_path, std::string image_bytes)
        : request_(std::move(request)),
          storage_path_(std::move(storage_path)),
          image_bytes_(std::move(image_bytes)) {
    }

    const CaptureRequest& request() const {
        return request_;
    }
    const std::string& storage_path() const {
        return storage_path_;
    }
    const std::string& image_bytes() const {
        return image_bytes_;
    }

private:
    CaptureRequest request_;
    std::string    storage_path_;
    std::string    image_bytes_;
};

// Process-wide capture settings. Built once at startup and handed to the
// orchestrator by value; nothing mutates them afterwards.
struct Settings {
    std::string storage_directory = "storage";
    int         timeout_seconds   = 30;
    std::string user_agent;
    // Adds --no-sandbox and --disable-dev-shm-usage. This removes Chromium's
    // privilege boundary and is meant for single-tenant containers only.
    bool        disable_sandbox = false;
    std::string browser_path;
};

}  // namespace Glimpse
