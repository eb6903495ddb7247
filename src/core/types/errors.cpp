#include "glimpse/errors.hpp"

namespace Glimpse {

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None:
            return "None";
        case ErrorType::BrowserStart:
            return "BrowserStartError";
        case ErrorType::Navigation:
            return "NavigationError";
        case ErrorType::NavigationTimeout:
            return "NavigationTimeoutError";
        case ErrorType::ScriptEvaluation:
            return "ScriptEvaluationError";
        case ErrorType::Capture:
            return "CaptureError";
        case ErrorType::Persistence:
            return "PersistenceError";
    }
    return "Unknown";
}

}  // namespace Glimpse
