#include "bulbs/core/CommandResult.hpp"

namespace bulbs::core {

const char* toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::Timeout:         return "timeout";
        case FailureKind::ConnectionError: return "connection error";
        case FailureKind::ProtocolError:   return "protocol error";
        case FailureKind::NotAttempted:    return "not attempted";
    }
    return "failure";
}

std::string DeviceFailure::describe() const {
    std::string text = toString(kind);
    if (!detail.empty()) {
        text += ": " + detail;
    } else if (cause) {
        text += ": " + cause.message();
    }
    return text;
}

} // namespace bulbs::core
