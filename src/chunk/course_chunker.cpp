#include "chunk/course_chunker.hpp"

#include <stdexcept>

#include "chunk/course_parser.hpp"
#include "util/hash.hpp"

namespace courserag {

std::string lesson_context_prefix(const std::string& course_title, std::optional<int> lesson_number) {
    if (lesson_number) {
        return "Course " + course_title + " Lesson " + std::to_string(*lesson_number) + " content: ";
    }
    return "Course " + course_title + " content: ";
}

CourseChunker::CourseChunker(ChunkerOptions options) : options_(options) {
    if (options_.chunk_size == 0 || options_.chunk_overlap == 0) {
        throw std::invalid_argument("chunk size and overlap must be positive");
    }
    if (options_.chunk_overlap >= options_.chunk_size) {
        throw std::invalid_argument("chunk overlap must be smaller than chunk size");
    }
}

ChunkedCourse CourseChunker::chunk(const std::string& document_text) const {
    auto parsed = parse_course_document(document_text);

    ChunkedCourse result;
    result.course = std::move(parsed.course);

    int index = 0;
    for (const auto& section : parsed.sections) {
        const std::string prefix = lesson_context_prefix(result.course.title, section.lesson_number);
        for (const auto& window : chunk_text(section.body, options_)) {
            Chunk chunk;
            chunk.chunk_index = index++;
            chunk.course_title = result.course.title;
            chunk.lesson_number = section.lesson_number;
            chunk.content = prefix;
            chunk.content.append(section.body, window.span.offset, window.span.length);
            chunk.content_sha256 = hash::sha256_hex(chunk.content);
            chunk.prefix_length = prefix.size();
            chunk.overlap_length = window.overlap;
            result.chunks.push_back(std::move(chunk));
        }
    }
    return result;
}

}  // namespace courserag
