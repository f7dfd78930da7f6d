#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/model/gemini_delegate.hpp"
#include "support/fakes.hpp"

#include <string>
#include <vector>

namespace call = voice_bridge::call;
namespace model = voice_bridge::model;

using voice_bridge::testing::FakeModelSession;

TEST_CASE("setup names the model and requests audio responses") {
    model::GeminiDelegate delegate("gemini-3-flash", std::string("Puck"), std::string("Be brief."));
    FakeModelSession session;
    delegate.configure_session(session, "c1");

    REQUIRE(session.control.size() == 1);
    const auto& setup = session.control[0]["setup"];
    REQUIRE(setup["model"] == "models/gemini-3-flash");
    REQUIRE(setup["generationConfig"]["responseModalities"][0] == "audio");
    REQUIRE(setup["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] ==
            "Puck");
    REQUIRE(setup["systemInstruction"]["parts"][0]["text"] == "Be brief.");
}

TEST_CASE("setup is sent even without voice or instructions") {
    model::GeminiDelegate delegate("models/gemini-3-flash", std::nullopt, std::nullopt);
    FakeModelSession session;
    delegate.configure_session(session, "c1");

    REQUIRE(session.control.size() == 1);
    REQUIRE_FALSE(session.control[0]["setup"].contains("systemInstruction"));
    REQUIRE_FALSE(session.control[0]["setup"]["generationConfig"].contains("speechConfig"));
}

TEST_CASE("greeting prompts and farewell are completed user turns") {
    model::GeminiDelegate delegate("gemini-3-flash", std::nullopt, std::nullopt, "Say hello.");
    FakeModelSession session;

    delegate.send_greeting(session, "c1");
    delegate.send_inactivity_prompt(session, "c1", "Are you still there?");
    delegate.send_inactivity_prompt(session, "c1", "");
    delegate.send_farewell(session, "c1", call::ExitReason::Timeout);

    REQUIRE(session.control.size() == 3);
    for (const auto& message : session.control) {
        REQUIRE(message["clientContent"]["turnComplete"] == true);
        REQUIRE(message["clientContent"]["turns"][0]["role"] == "user");
    }
    REQUIRE(session.control[0]["clientContent"]["turns"][0]["parts"][0]["text"] == "Say hello.");
    REQUIRE(session.control[1]["clientContent"]["turns"][0]["parts"][0]["text"] == "Are you still there?");
    REQUIRE(session.control[2]["clientContent"]["turns"][0]["parts"][0]["text"] ==
            "Say exactly: " + std::string(call::farewell_message(call::ExitReason::Timeout)));
}

TEST_CASE("classify maps server content to call signals") {
    model::GeminiDelegate delegate("gemini-3-flash", std::nullopt, std::nullopt);
    std::vector<call::ToolCall> tool_calls;

    const nlohmann::json speaking{{"serverContent", {{"modelTurn", {{"parts", nlohmann::json::array()}}}}}};
    REQUIRE(delegate.classify(speaking, tool_calls) == call::ModelSignal::AiSpeechStarted);
    REQUIRE(delegate.classify({{"serverContent", {{"turnComplete", true}}}}, tool_calls) ==
            call::ModelSignal::AiSpeechStopped);
    REQUIRE(delegate.classify({{"serverContent", {{"generationComplete", true}}}}, tool_calls) ==
            call::ModelSignal::AiSpeechStopped);
    REQUIRE(delegate.classify({{"serverContent", {{"interrupted", true}}}}, tool_calls) ==
            call::ModelSignal::UserSpeechStarted);
    REQUIRE(delegate.classify({{"setupComplete", nlohmann::json::object()}}, tool_calls) ==
            call::ModelSignal::None);
    REQUIRE(delegate.classify(nlohmann::json::array(), tool_calls) == call::ModelSignal::None);
    REQUIRE(delegate.classify({{"serverContent", {{"interrupted", "yes"}}}}, tool_calls) ==
            call::ModelSignal::None);
    const nlohmann::json numeric_id{
        {"toolCall", {{"functionCalls", nlohmann::json::array({{{"id", 7}, {"name", "lookup"}}})}}}};
    REQUIRE(delegate.classify(numeric_id, tool_calls) == call::ModelSignal::None);
    REQUIRE(tool_calls.empty());
}

TEST_CASE("classify collects every function call in a tool call message") {
    model::GeminiDelegate delegate("gemini-3-flash", std::nullopt, std::nullopt);
    std::vector<call::ToolCall> tool_calls;
    const nlohmann::json message{
        {"toolCall", {
            {"functionCalls", nlohmann::json::array({
                {{"id", "fc_1"}, {"name", "lookup_order"}, {"args", {{"order", 7}}}},
                {{"id", "fc_2"}, {"name", "transfer"}, {"args", "{\"queue\":\"billing\"}"}},
                {{"name", "no_id"}},
            })},
        }},
    };

    REQUIRE(delegate.classify(message, tool_calls) == call::ModelSignal::ToolCallRequested);
    REQUIRE(tool_calls.size() == 2);
    REQUIRE(tool_calls[0].call_id == "fc_1");
    REQUIRE(tool_calls[0].name == "lookup_order");
    REQUIRE(nlohmann::json::parse(tool_calls[0].arguments)["order"] == 7);
    REQUIRE(tool_calls[1].arguments == "{\"queue\":\"billing\"}");

    std::vector<call::ToolCall> none;
    const nlohmann::json empty{{"toolCall", {{"functionCalls", nlohmann::json::array()}}}};
    REQUIRE(delegate.classify(empty, none) == call::ModelSignal::None);
}

TEST_CASE("tool results echo the call name and wrap plain text") {
    model::GeminiDelegate delegate("gemini-3-flash", std::nullopt, std::nullopt);
    FakeModelSession session;
    const call::ToolCall request{"fc_1", "lookup_order", "{}"};

    delegate.send_tool_result(session, request, "{\"status\":\"shipped\"}");
    delegate.send_tool_result(session, request, "shipped yesterday");

    REQUIRE(session.control.size() == 2);
    const auto& first = session.control[0]["toolResponse"]["functionResponses"][0];
    REQUIRE(first["id"] == "fc_1");
    REQUIRE(first["name"] == "lookup_order");
    REQUIRE(first["response"]["status"] == "shipped");
    const auto& second = session.control[1]["toolResponse"]["functionResponses"][0];
    REQUIRE(second["response"]["result"] == "shipped yesterday");
}
