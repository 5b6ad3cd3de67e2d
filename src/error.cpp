#include "error.hpp"

namespace stagegate {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::Format:
            return "Format";
        case ErrorCategory::Security:
            return "Security";
        case ErrorCategory::Io:
            return "Io";
        case ErrorCategory::Configuration:
            return "Configuration";
        default:
            return "Unknown";
    }
}

int Error::exitCode() const {
    switch (category) {
        case ErrorCategory::Format:
            return 1;
        case ErrorCategory::Security:
            return 2;
        default:
            return 3;
    }
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"]["category"] = getCategoryName();
    error_json["error"]["message"] = message;

    if (!details.empty()) {
        error_json["error"]["details"] = details;
    }

    return error_json;
}

} // namespace stagegate
