#include "service/query_orchestrator.hpp"
#include "session/memory_session_store.hpp"
#include "util/cancellation.hpp"
#include "util/errors.hpp"

#include "../support/engine_fixture.hpp"
#include "../support/scripted_generation_client.hpp"
#include "../test_logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using namespace std::chrono_literals;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

bool WaitFor(const courserag::CancellationToken& token, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!token.is_cancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    return token.is_cancelled();
}

void ScenarioDisconnectCancelsToken() {
    courserag::tests::Log("scenario: a closed peer cancels the token");
    courserag::CancellationToken token;
    std::atomic<bool> peer_gone{false};
    {
        const courserag::CancelOnDisconnect watch{token, [&peer_gone] { return peer_gone.load(); }, 5ms};
        std::this_thread::sleep_for(20ms);
        Require(!token.is_cancelled(), "connected peer must not cancel");
        peer_gone = true;
        Require(WaitFor(token, 2s), "disconnect must cancel the token");
    }
    Require(token.is_cancelled(), "cancellation sticks after the watcher stops");
}

void ScenarioWatcherStopsCleanly() {
    courserag::tests::Log("scenario: watcher stops without cancelling a finished turn");
    courserag::CancellationToken token;
    {
        const courserag::CancelOnDisconnect watch{token, [] { return false; }, 5ms};
        std::this_thread::sleep_for(15ms);
    }
    Require(!token.is_cancelled(), "finished turn keeps an uncancelled token");

    const courserag::CancelOnDisconnect without_check{token, nullptr};
    Require(!token.is_cancelled(), "no disconnect check, no cancellation");
}

void ScenarioDisconnectMidTurnWritesNoHistory() {
    courserag::tests::Log("scenario: client disconnect during generation aborts the turn");
    courserag::tests::EngineFixture engine;
    courserag::tests::ScriptedGenerationClient generation;
    courserag::InMemorySessionStore sessions{2};
    courserag::QueryOrchestrator orchestrator{generation, engine.tools, sessions, courserag::OrchestratorOptions{}};

    courserag::CancellationToken token;
    std::atomic<bool> peer_gone{false};
    generation.on_generate([&](const courserag::GenerationRequest& request) {
        Require(request.cancel == &token, "token forwarded to the generation call");
        peer_gone = true;
        Require(WaitFor(token, 2s), "disconnect observed while generating");
    });
    generation.push(courserag::ToolRequest{
        {courserag::tests::MakeCall("c1", "search_course_content", {{"query", "setup"}})}, ""});

    bool cancelled = false;
    {
        const courserag::CancelOnDisconnect watch{token, [&peer_gone] { return peer_gone.load(); }, 5ms};
        try {
            orchestrator.query("s-1", "How do I set up MCP?", &token);
        } catch (const courserag::TurnCancelled&) {
            cancelled = true;
        }
    }
    Require(cancelled, "turn must end with TurnCancelled");
    Require(generation.requests().size() == 1, "no further generation after the disconnect");
    Require(sessions.history("s-1").empty(), "cancelled turn writes no history");
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("cancellation_test: start");
        ScenarioDisconnectCancelsToken();
        ScenarioWatcherStopsCleanly();
        ScenarioDisconnectMidTurnWritesNoHistory();
        courserag::tests::Log("cancellation_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
