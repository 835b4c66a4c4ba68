#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace courserag {

struct Chunk {
    // Zero-based, contiguous within the owning course, in document order.
    int chunk_index = 0;
    std::string course_title;
    // Empty for text that precedes the first lesson heading.
    std::optional<int> lesson_number;
    // Context prefix followed by the lesson text window.
    std::string content;
    std::string content_sha256;

    std::size_t prefix_length = 0;
    // Leading characters of the window repeated from the previous chunk of
    // the same lesson.
    std::size_t overlap_length = 0;

    std::string body() const { return content.substr(prefix_length); }
};

}  // namespace courserag
