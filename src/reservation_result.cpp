#include "reservation_result.hpp"

namespace reservation {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::Forbidden: return "Forbidden";
        case ErrorCode::PreconditionFailed: return "PreconditionFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

int http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return 200;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::Conflict: return 409;
        case ErrorCode::Forbidden: return 403;
        case ErrorCode::PreconditionFailed: // request made in the wrong seat state
        case ErrorCode::InvalidArgument: return 400;
    }
    return 500;
}

} // namespace reservation
