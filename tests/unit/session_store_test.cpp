#include "session/memory_session_store.hpp"

#include "../test_logger.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void ScenarioBoundEvictsOldest() {
    courserag::tests::Log("scenario: N+1 appends keep the newest N");
    courserag::InMemorySessionStore store(3);
    for (int i = 0; i < 4; ++i) {
        store.append("s", "q" + std::to_string(i), "a" + std::to_string(i));
    }
    const auto history = store.history("s");
    Require(history.size() == 3, "history must be capped at the bound");
    Require(history.front().query == "q1", "oldest exchange evicted first");
    Require(history.back().answer == "a3", "most recent exchange last");
}

void ScenarioLazySessionsAndClear() {
    courserag::tests::Log("scenario: unknown sessions read empty, clear drops history");
    courserag::InMemorySessionStore store(2);
    Require(store.history("never-used").empty(), "unknown session reads as empty");
    store.append("s", "q", "a");
    store.append("other", "q", "a");
    store.clear("s");
    Require(store.history("s").empty(), "cleared session is empty");
    Require(store.history("other").size() == 1, "other sessions untouched");
    store.clear("never-used");

    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        ids.insert(store.create_session());
    }
    Require(ids.size() == 50, "session ids must be unique");
    Require(store.max_exchanges() == 2, "bound reported");
}

void ScenarioConcurrentAppends() {
    courserag::tests::Log("scenario: concurrent appends keep every history bounded");
    courserag::InMemorySessionStore store(5);
    std::atomic<int> violations{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, &violations, t] {
            const std::string own = "session-" + std::to_string(t);
            for (int i = 0; i < 200; ++i) {
                store.append(own, "q" + std::to_string(i), "a" + std::to_string(i));
                store.append("shared", own, std::to_string(i));
                if (store.history("shared").size() > 5) {
                    violations.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    Require(violations.load() == 0, "bound exceeded under concurrency");
    Require(store.history("shared").size() == 5, "shared session holds exactly the bound");
    for (int t = 0; t < 8; ++t) {
        const auto history = store.history("session-" + std::to_string(t));
        Require(history.size() == 5, "per-session history bounded");
        Require(history.back().query == "q199", "per-session order preserved");
    }
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("session_store_test: start");
        ScenarioBoundEvictsOldest();
        ScenarioLazySessionsAndClear();
        ScenarioConcurrentAppends();
        courserag::tests::Log("session_store_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
