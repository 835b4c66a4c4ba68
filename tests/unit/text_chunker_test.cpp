#include "chunk/course_chunker.hpp"
#include "chunk/text_chunker.hpp"

#include "../support/sample_courses.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

std::string LongLesson() {
    std::string text;
    for (int i = 0; i < 40; ++i) {
        text += "Sentence number " + std::to_string(i) + " explains one more detail of the topic. ";
    }
    text += "Dr. Smith wrote e.g. this line. The end!";
    return text;
}

std::string Reconstruct(std::string_view text, const std::vector<courserag::TextWindow>& windows) {
    std::string out;
    for (const auto& window : windows) {
        out += text.substr(window.span.offset + window.overlap, window.span.length - window.overlap);
    }
    return out;
}

void ScenarioSentenceSplitting() {
    courserag::tests::Log("scenario: sentence splitting");
    const std::string text = "Dr. Smith met Mr. Jones. They talked, e.g. about the U.S. economy! Was it fun? Yes.";
    const auto spans = courserag::split_sentences(text);
    Require(spans.size() == 4, "expected four sentences, got " + std::to_string(spans.size()));
    Require(text.substr(spans[0].offset, spans[0].length) == "Dr. Smith met Mr. Jones. ",
            "abbreviations must not end a sentence");
    std::size_t covered = 0;
    for (const auto& span : spans) {
        Require(span.offset == covered, "sentence spans must tile the text");
        covered = span.end();
    }
    Require(covered == text.size(), "sentence spans must cover the text");
}

void ScenarioWindowsRespectLimits() {
    courserag::tests::Log("scenario: windows respect size and overlap");
    const auto text = LongLesson();
    const courserag::ChunkerOptions options{.chunk_size = 200, .chunk_overlap = 80};
    const auto windows = courserag::chunk_text(text, options);

    Require(windows.size() > 1, "long text must produce several windows");
    Require(windows.front().overlap == 0, "first window has no overlap");
    for (std::size_t i = 0; i < windows.size(); ++i) {
        Require(windows[i].span.length <= options.chunk_size, "window exceeds chunk size");
        Require(windows[i].overlap <= options.chunk_overlap, "overlap exceeds budget");
        if (i > 0) {
            Require(windows[i].span.offset > windows[i - 1].span.offset, "windows must advance");
            Require(windows[i].overlap > 0, "sentence-sized overlap expected between windows");
        }
        const char first = text[windows[i].span.offset];
        Require(first == 'S' || first == 'D' || first == 'T', "windows must start at a sentence boundary");
    }
    courserag::tests::LogKV("windows", static_cast<std::uint64_t>(windows.size()));
}

void ScenarioCoverageAndIdempotence() {
    courserag::tests::Log("scenario: coverage and idempotence");
    const auto text = LongLesson();
    const courserag::ChunkerOptions options{.chunk_size = 150, .chunk_overlap = 60};
    const auto first = courserag::chunk_text(text, options);
    const auto second = courserag::chunk_text(text, options);

    Require(Reconstruct(text, first) == text, "non-overlap regions must reconstruct the text");
    Require(first.size() == second.size(), "re-chunking must yield the same count");
    for (std::size_t i = 0; i < first.size(); ++i) {
        Require(first[i].span.offset == second[i].span.offset && first[i].span.length == second[i].span.length &&
                    first[i].overlap == second[i].overlap,
                "re-chunking must yield identical windows");
    }
}

void ScenarioOversizedSentence() {
    courserag::tests::Log("scenario: oversized sentence is cut at whitespace");
    std::string text;
    for (int i = 0; i < 60; ++i) {
        text += "word" + std::to_string(i) + " ";
    }
    text += "\xC3\xA9t\xC3\xA9.";
    const courserag::ChunkerOptions options{.chunk_size = 50, .chunk_overlap = 10};
    const auto windows = courserag::chunk_text(text, options);
    Require(Reconstruct(text, windows) == text, "cut sentence must still reconstruct");
    for (const auto& window : windows) {
        Require(window.span.length <= options.chunk_size, "piece exceeds chunk size");
        const auto lead = static_cast<unsigned char>(text[window.span.offset]);
        Require((lead & 0xC0) != 0x80, "window must not start inside a UTF-8 sequence");
    }
}

void ScenarioInvalidOptions() {
    courserag::tests::Log("scenario: invalid options");
    bool threw = false;
    try {
        courserag::chunk_text("Some text.", courserag::ChunkerOptions{.chunk_size = 10, .chunk_overlap = 10});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    Require(threw, "overlap equal to size must be rejected");
    Require(courserag::chunk_text("", courserag::ChunkerOptions{}).empty(), "empty text yields no windows");
}

void ScenarioCourseChunks() {
    courserag::tests::Log("scenario: course chunks carry context and contiguous indices");
    const courserag::CourseChunker chunker{courserag::ChunkerOptions{.chunk_size = 60, .chunk_overlap = 30}};
    const auto chunked = chunker.chunk(courserag::tests::kMcpCourse);

    Require(chunked.course.title == "Intro to MCP", "course metadata expected");
    Require(chunked.chunks.size() > 3, "small windows must split lessons");
    std::map<int, std::string> bodies;
    for (std::size_t i = 0; i < chunked.chunks.size(); ++i) {
        const auto& chunk = chunked.chunks[i];
        Require(chunk.chunk_index == static_cast<int>(i), "chunk indices must be contiguous from 0");
        Require(chunk.course_title == "Intro to MCP", "owning course mismatch");
        Require(chunk.lesson_number.has_value(), "every chunk belongs to a lesson here");
        const auto prefix = courserag::lesson_context_prefix(chunk.course_title, chunk.lesson_number);
        Require(chunk.content.rfind(prefix, 0) == 0, "content must start with the lesson context");
        Require(chunk.content_sha256.size() == 64, "content hash expected");
        bodies[*chunk.lesson_number] += chunk.body().substr(chunk.overlap_length);
    }
    Require(bodies[2] == "Servers expose resources and prompts. Each server declares its capabilities during setup.",
            "lesson 2 body must be reconstructed losslessly");

    const auto again = chunker.chunk(courserag::tests::kMcpCourse);
    Require(again.chunks.size() == chunked.chunks.size(), "chunking must be idempotent");
    for (std::size_t i = 0; i < again.chunks.size(); ++i) {
        Require(again.chunks[i].content == chunked.chunks[i].content, "chunk text must be identical");
    }
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("text_chunker_test: start");
        ScenarioSentenceSplitting();
        ScenarioWindowsRespectLimits();
        ScenarioCoverageAndIdempotence();
        ScenarioOversizedSentence();
        ScenarioInvalidOptions();
        ScenarioCourseChunks();
        courserag::tests::Log("text_chunker_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
