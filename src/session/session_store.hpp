#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "model/course.hpp"

namespace courserag {

// Bounded per-session conversation history. Each session keeps at most
// max_exchanges() exchanges, oldest dropped first. Unknown session ids read
// as empty and are created on first append.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::string create_session() = 0;
    virtual void append(const std::string& session_id, const std::string& query, const std::string& answer) = 0;
    // Oldest first.
    virtual std::vector<Exchange> history(const std::string& session_id) const = 0;
    virtual void clear(const std::string& session_id) = 0;
    virtual std::size_t max_exchanges() const noexcept = 0;
};

}  // namespace courserag
