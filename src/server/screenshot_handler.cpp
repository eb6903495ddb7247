#include "screenshot_handler.hpp"
#include <limits>
#include <optional>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"

namespace Glimpse {
namespace Server {

using namespace Glimpse::Core;
using nlohmann::json;

namespace http = boost::beast::http;

namespace {

std::optional<int> read_int(const json& body, const char* key, int minimum) {
    if (!body.contains(key) || body[key].is_null())
        return std::nullopt;

    const auto& value = body[key];
    if (!value.is_number_integer())
        throw ValidationError(std::string(key) + " must be an integer");

    constexpr int maximum = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()
        && value.get<unsigned long long>() > static_cast<unsigned long long>(maximum))
        throw ValidationError(std::string(key) + " must be at most " + std::to_string(maximum));

    auto number = value.get<long long>();
    if (number > maximum)
        throw ValidationError(std::string(key) + " must be at most " + std::to_string(maximum));
    if (number < minimum)
        throw ValidationError(std::string(key) + " must be at least " + std::to_string(minimum));
    return static_cast<int>(number);
}

json optional_to_json(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

ScreenshotHandler::ScreenshotHandler(
    std::shared_ptr<const Engine::CaptureOrchestrator> orchestrator,
    std::string                                        allowed_origin)
    : orchestrator_(std::move(orchestrator)), allowed_origin_(std::move(allowed_origin)) {
}

CaptureRequest ScreenshotHandler::parse_request(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw ValidationError("Request body must be a JSON object");

    if (!j.contains("url") || !j["url"].is_string()
        || Utils::Text::trim(j["url"].get<std::string>()).empty())
        throw ValidationError("url must be a non-empty string");

    CaptureRequest request;
    request.url           = j["url"].get<std::string>();
    request.width         = read_int(j, "width", 1);
    request.height        = read_int(j, "height", 1);
    request.delay_seconds = read_int(j, "delay", 0);

    if (j.contains("fullPage") && !j["fullPage"].is_null()) {
        if (!j["fullPage"].is_boolean())
            throw ValidationError("fullPage must be a boolean");
        request.full_page = j["fullPage"].get<bool>();
    }
    return request;
}

json ScreenshotHandler::to_json(const CaptureResult& result) {
    const auto& request = result.request();
    return {{"url", request.url},
            {"width", optional_to_json(request.width)},
            {"height", optional_to_json(request.height)},
            {"delay", optional_to_json(request.delay_seconds)},
            {"fullPage", request.full_page},
            {"path", result.storage_path()},
            {"bytes", Utils::Text::base64_encode(result.image_bytes())}};
}

http::status ScreenshotHandler::status_for(ErrorType type) {
    switch (type) {
        case ErrorType::BrowserStart:
            return http::status::service_unavailable;
        case ErrorType::Navigation:
        case ErrorType::Capture:
            return http::status::bad_gateway;
        case ErrorType::NavigationTimeout:
            return http::status::gateway_timeout;
        case ErrorType::Persistence:
        case ErrorType::ScriptEvaluation:
        case ErrorType::None:
            break;
    }
    return http::status::internal_server_error;
}

boost::asio::awaitable<Response> ScreenshotHandler::handle(const Request& req) const {
    std::string target(req.target());
    size_t      query = target.find('?');
    if (query != std::string::npos)
        target.resize(query);

    if (target != kRoute)
        co_return make_error(req, http::status::not_found, "NotFound", "No route for " + target);

    if (req.method() == http::verb::options) {
        Response res{http::status::no_content, req.version()};
        res.set(http::field::server, std::string("Glimpse/") + Constants::VERSION);
        res.set(http::field::access_control_allow_methods, "POST");
        auto requested = req.find(http::field::access_control_request_headers);
        res.set(http::field::access_control_allow_headers,
                requested != req.end() ? std::string(requested->value()) : std::string("*"));
        apply_cors(req, res);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        co_return res;
    }

    if (req.method() != http::verb::post) {
        auto res = make_error(
            req, http::status::method_not_allowed, "MethodNotAllowed", "Use POST " + target);
        res.set(http::field::allow, "POST, OPTIONS");
        co_return res;
    }

    CaptureRequest          request;
    std::optional<Response> failure;
    try {
        request = parse_request(req.body());
    } catch (const ValidationError& e) {
        Logger::warn("Rejected screenshot request: " + std::string(e.what()));
        failure = make_error(req, http::status::bad_request, "ValidationError", e.what());
    }
    if (failure)
        co_return std::move(*failure);

    try {
        CaptureResult result = co_await orchestrator_->capture(request);
        co_return make_response(req, http::status::ok, to_json(result));
    } catch (const Error& e) {
        Logger::error("Capture failed [" + request.url + "]: " + to_string(e.type()) + ": "
                      + e.what());
        failure = make_error(req, status_for(e.type()), to_string(e.type()), e.what());
    } catch (const std::exception& e) {
        Logger::error("Capture failed [" + request.url + "]: " + e.what());
        failure =
            make_error(req, http::status::internal_server_error, "InternalError", e.what());
    }
    co_return std::move(*failure);
}

Response ScreenshotHandler::make_response(const Request& req,
                                          http::status   status,
                                          const json&    body) const {
    Response res{status, req.version()};
    res.set(http::field::server, std::string("Glimpse/") + Constants::VERSION);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    apply_cors(req, res);
    res.prepare_payload();
    return res;
}

Response ScreenshotHandler::make_error(const Request&     req,
                                       http::status       status,
                                       const std::string& kind,
                                       const std::string& message) const {
    return make_response(req, status, {{"error", kind}, {"message", message}});
}

void ScreenshotHandler::apply_cors(const Request& req, Response& res) const {
    if (allowed_origin_.empty())
        return;
    if (allowed_origin_ == "*") {
        res.set(http::field::access_control_allow_origin, "*");
        return;
    }

    auto origin = req.find(http::field::origin);
    if (origin != req.end() && std::string(origin->value()) == allowed_origin_) {
        res.set(http::field::access_control_allow_origin, allowed_origin_);
        res.set(http::field::access_control_allow_credentials, "true");
        res.set(http::field::vary, "Origin");
    }
}

}  // namespace Server
}  // namespace Glimpse
