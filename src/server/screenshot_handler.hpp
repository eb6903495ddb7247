#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "../engine/capture/capture_orchestrator.hpp"
#include "glimpse/capture.hpp"
#include "glimpse/errors.hpp"

namespace Glimpse {
namespace Server {

using Request  = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {
    }
};

// POST /screenshot: JSON in, CaptureResult (image base64 encoded) out.
class ScreenshotHandler {
public:
    static constexpr const char* kRoute = "/screenshot";

    ScreenshotHandler(std::shared_ptr<const Engine::CaptureOrchestrator> orchestrator,
                      std::string                                        allowed_origin);

    boost::asio::awaitable<Response> handle(const Request& req) const;

    // Throws ValidationError.
    static CaptureRequest            parse_request(const std::string& body);
    static nlohmann::json            to_json(const CaptureResult& result);
    static boost::beast::http::status status_for(ErrorType type);

private:
    Response make_response(const Request&             req,
                           boost::beast::http::status status,
                           const nlohmann::json&      body) const;
    Response make_error(const Request&             req,
                        boost::beast::http::status status,
                        const std::string&         kind,
                        const std::string&         message) const;
    void     apply_cors(const Request& req, Response& res) const;

    std::shared_ptr<const Engine::CaptureOrchestrator> orchestrator_;
    std::string                                        allowed_origin_;
};

}  // namespace Server
}  // namespace Glimpse
