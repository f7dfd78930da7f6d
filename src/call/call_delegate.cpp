#include "voice_bridge/call/call_delegate.hpp"

namespace voice_bridge::call {

const char* to_string(ModelSignal signal) {
    switch (signal) {
        case ModelSignal::None:
            return "none";
        case ModelSignal::AiSpeechStarted:
            return "ai_speech_started";
        case ModelSignal::AiSpeechStopped:
            return "ai_speech_stopped";
        case ModelSignal::UserSpeechStarted:
            return "user_speech_started";
        case ModelSignal::ToolCallRequested:
            return "tool_call_requested";
    }
    return "none";
}

}
