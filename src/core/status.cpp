#include <clusterlb/core/status.h>

namespace clusterlb {

const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::no_nodes_available: return "no_nodes_available";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

std::string Status::ToString() const {
    if (ok()) {
        return "ok";
    }
    std::string out(StatusCodeName(code_));
    if (!message_.empty()) {
        out.append(": ");
        out.append(message_);
    }
    return out;
}

} // namespace clusterlb
