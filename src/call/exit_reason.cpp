#include "voice_bridge/call/exit_reason.hpp"

namespace voice_bridge::call {

const char* to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::Timeout:
            return "timeout";
        case ExitReason::Silence:
            return "silence";
        case ExitReason::Default:
            return "default";
    }
    return "default";
}

std::optional<ExitReason> parse_exit_reason(const std::string& name) {
    if (name == "timeout") {
        return ExitReason::Timeout;
    }
    if (name == "silence") {
        return ExitReason::Silence;
    }
    if (name == "default") {
        return ExitReason::Default;
    }
    return std::nullopt;
}

const char* farewell_message(ExitReason reason) {
    switch (reason) {
        case ExitReason::Timeout:
            return "We've reached the call time limit. We will end the call. "
                   "You're welcome to contact us again anytime.";
        case ExitReason::Silence:
            return "We haven't heard from you for a while. We will end the call. "
                   "If you need help, please call us again anytime.";
        case ExitReason::Default:
            break;
    }
    return "We will end the call. Please feel free to contact us again anytime.";
}

}
