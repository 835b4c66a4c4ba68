#include "chunk/text_chunker.hpp"

#include <cctype>
#include <stdexcept>

namespace courserag {
namespace {

bool is_space(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

bool is_closing(char ch) { return ch == '"' || ch == '\'' || ch == ')' || ch == ']'; }

// "Dr." / "Mr." / "J." / "e.g." / "U.S." style tokens ending at the period.
bool is_abbreviation(std::string_view text, std::size_t period) {
    std::size_t word_begin = period;
    while (word_begin > 0 && std::isalpha(static_cast<unsigned char>(text[word_begin - 1]))) {
        --word_begin;
    }
    const std::size_t word_length = period - word_begin;
    if (word_length == 1 && std::isupper(static_cast<unsigned char>(text[word_begin]))) {
        return true;
    }
    if (word_length == 2 && std::isupper(static_cast<unsigned char>(text[word_begin])) &&
        std::islower(static_cast<unsigned char>(text[word_begin + 1]))) {
        return true;
    }
    return period >= 3 && text[period - 2] == '.' && std::isalnum(static_cast<unsigned char>(text[period - 1])) &&
           std::isalnum(static_cast<unsigned char>(text[period - 3]));
}

// Returns the offset where the next sentence starts if a boundary begins at
// pos, otherwise 0.
std::size_t boundary_after(std::string_view text, std::size_t pos) {
    const char ch = text[pos];
    if (ch == '\n') {
        std::size_t next = pos + 1;
        bool blank_line = false;
        while (next < text.size() && is_space(text[next])) {
            if (text[next] == '\n') {
                blank_line = true;
            }
            ++next;
        }
        return (blank_line && next < text.size()) ? next : 0;
    }

    if (ch != '.' && ch != '!' && ch != '?') {
        return 0;
    }
    if (ch == '.' && is_abbreviation(text, pos)) {
        return 0;
    }
    std::size_t next = pos + 1;
    while (next < text.size() && is_closing(text[next])) {
        ++next;
    }
    if (next >= text.size() || !is_space(text[next])) {
        return 0;
    }
    while (next < text.size() && is_space(text[next])) {
        ++next;
    }
    if (next >= text.size() || !std::isupper(static_cast<unsigned char>(text[next]))) {
        return 0;
    }
    return next;
}

// Cuts one oversized sentence into pieces no longer than limit, preferring to
// end each piece right after whitespace and never splitting a UTF-8 sequence.
void append_pieces(std::string_view text, TextSpan sentence, std::size_t limit, std::vector<TextSpan>& out) {
    std::size_t start = sentence.offset;
    const std::size_t end = sentence.end();
    while (end - start > limit) {
        std::size_t cut = start + limit;
        std::size_t soft = cut;
        while (soft > start + 1 && !is_space(text[soft - 1])) {
            --soft;
        }
        if (soft > start + 1) {
            cut = soft;
        } else {
            while (cut > start + 1 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
                --cut;
            }
        }
        out.push_back(TextSpan{start, cut - start});
        start = cut;
    }
    if (end > start) {
        out.push_back(TextSpan{start, end - start});
    }
}

}  // namespace

std::vector<TextSpan> split_sentences(std::string_view text) {
    std::vector<TextSpan> spans;
    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t next = boundary_after(text, pos);
        if (next == 0) {
            ++pos;
            continue;
        }
        spans.push_back(TextSpan{start, next - start});
        start = next;
        pos = next;
    }
    if (start < text.size()) {
        spans.push_back(TextSpan{start, text.size() - start});
    }
    return spans;
}

std::vector<TextWindow> chunk_text(std::string_view text, const ChunkerOptions& options) {
    if (options.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (options.chunk_overlap >= options.chunk_size) {
        throw std::invalid_argument("chunk_overlap must be smaller than chunk_size");
    }

    std::vector<TextSpan> units;
    for (const auto& sentence : split_sentences(text)) {
        append_pieces(text, sentence, options.chunk_size, units);
    }

    std::vector<TextWindow> windows;
    const std::size_t count = units.size();
    std::size_t first = 0;
    std::size_t previous_end = 0;
    while (first < count) {
        const std::size_t start = units[first].offset;
        std::size_t last = first + 1;
        while (last < count && units[last].end() - start <= options.chunk_size) {
            ++last;
        }
        const std::size_t end = units[last - 1].end();
        const std::size_t overlap = (!windows.empty() && previous_end > start) ? previous_end - start : 0;
        windows.push_back(TextWindow{TextSpan{start, end - start}, overlap});
        previous_end = end;
        if (last == count) {
            break;
        }

        // Carry trailing sentences that fit in the overlap budget, but never
        // so many that the next unseen sentence no longer fits.
        std::size_t next = last;
        while (next - 1 > first && end - units[next - 1].offset <= options.chunk_overlap) {
            --next;
        }
        while (next < last && units[last].end() - units[next].offset > options.chunk_size) {
            ++next;
        }
        first = next;
    }
    return windows;
}

}  // namespace courserag
