#pragma once

#include <optional>
#include <string>

namespace voice_bridge {
namespace call {

enum class ExitReason {
    Timeout,
    Silence,
    Default
};

const char* to_string(ExitReason reason);
std::optional<ExitReason> parse_exit_reason(const std::string& name);

// Text spoken to the caller before the call is closed.
const char* farewell_message(ExitReason reason);

}
}
