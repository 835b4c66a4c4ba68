#pragma once

#include <optional>
#include <string>
#include <vector>

#include "chunk/chunk.hpp"
#include "chunk/text_chunker.hpp"
#include "model/course.hpp"

namespace courserag {

struct ChunkedCourse {
    Course course;
    std::vector<Chunk> chunks;
};

// Context baked into every chunk so that an out-of-order hit still names its
// course and lesson.
std::string lesson_context_prefix(const std::string& course_title, std::optional<int> lesson_number);

class CourseChunker {
public:
    explicit CourseChunker(ChunkerOptions options);

    // Parses and chunks a whole course document. Throws ParseError.
    ChunkedCourse chunk(const std::string& document_text) const;

    const ChunkerOptions& options() const noexcept { return options_; }

private:
    ChunkerOptions options_;
};

}  // namespace courserag
