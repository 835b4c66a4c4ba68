#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace courserag {

struct ChunkerOptions {
    std::size_t chunk_size = 800;
    std::size_t chunk_overlap = 100;
};

// Half-open byte range [offset, offset + length) into the chunked text.
struct TextSpan {
    std::size_t offset = 0;
    std::size_t length = 0;

    std::size_t end() const noexcept { return offset + length; }
};

struct TextWindow {
    TextSpan span;
    // Leading bytes shared with the previous window.
    std::size_t overlap = 0;
};

// Splits text into sentence spans that tile it completely; each span carries
// its trailing whitespace. Boundaries are sentence punctuation followed by
// whitespace and an upper-case letter, or a blank line. Common abbreviations
// ("Dr.", "e.g.") do not end a sentence.
std::vector<TextSpan> split_sentences(std::string_view text);

// Packs whole sentences into windows of at most chunk_size bytes and carries
// up to chunk_overlap bytes of trailing sentences into the next window. A
// sentence longer than chunk_size is cut at whitespace first.
std::vector<TextWindow> chunk_text(std::string_view text, const ChunkerOptions& options);

}  // namespace courserag
