#include "chunk/course_parser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>
#include <string_view>

#include "util/errors.hpp"

namespace courserag {
namespace {

const std::regex& lesson_header_pattern() {
    static const std::regex pattern(R"(^\s*lesson\s+(\d+)\s*:\s*(.*?)\s*$)", std::regex::icase);
    return pattern;
}

std::string trim(std::string_view value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string{value.substr(begin, end - begin)};
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

// Matches "<key>: <value>" with a case-insensitive key. Returns the trimmed
// value on match.
std::optional<std::string> header_value(const std::string& line, std::string_view key) {
    const std::string trimmed = trim(line);
    if (trimmed.size() <= key.size() || trimmed[key.size()] != ':') {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(trimmed[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
            return std::nullopt;
        }
    }
    return trim(std::string_view{trimmed}.substr(key.size() + 1));
}

std::optional<std::string> non_empty(std::optional<std::string> value) {
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

std::string join_body(const std::vector<std::string>& lines) {
    std::string body;
    for (const auto& line : lines) {
        if (!body.empty()) {
            body.push_back('\n');
        }
        body += line;
    }
    return trim(body);
}

}  // namespace

ParsedCourse parse_course_document(const std::string& text) {
    const auto lines = split_lines(text);

    ParsedCourse parsed;
    std::optional<std::string> title;
    std::size_t pos = 0;
    for (; pos < lines.size(); ++pos) {
        const auto& line = lines[pos];
        if (trim(line).empty()) {
            continue;
        }
        if (auto value = header_value(line, "Course Title")) {
            title = std::move(value);
        } else if (auto link = header_value(line, "Course Link")) {
            parsed.course.link = non_empty(std::move(link));
        } else if (auto instructor = header_value(line, "Course Instructor")) {
            parsed.course.instructor = non_empty(std::move(instructor));
        } else {
            break;
        }
    }

    if (!title || title->empty()) {
        throw ParseError("course document is missing the 'Course Title:' header");
    }
    parsed.course.title = std::move(*title);

    std::set<int> seen_lessons;
    std::optional<int> current_lesson;
    std::vector<std::string> body_lines;

    auto flush_section = [&]() {
        std::string body = join_body(body_lines);
        body_lines.clear();
        if (!body.empty()) {
            parsed.sections.push_back(LessonSection{current_lesson, std::move(body)});
        }
    };

    for (; pos < lines.size(); ++pos) {
        const auto& line = lines[pos];
        std::smatch match;
        if (!std::regex_match(line, match, lesson_header_pattern())) {
            body_lines.push_back(line);
            continue;
        }

        flush_section();

        int number = 0;
        try {
            number = std::stoi(match[1].str());
        } catch (const std::exception&) {
            throw ParseError("lesson number out of range: " + match[1].str());
        }
        if (!seen_lessons.insert(number).second) {
            throw ParseError("duplicate lesson number " + std::to_string(number) + " in course '" +
                             parsed.course.title + "'");
        }

        Lesson lesson;
        lesson.number = number;
        lesson.title = match[2].str();
        if (lesson.title.empty()) {
            lesson.title = "Lesson " + std::to_string(number);
        }
        if (pos + 1 < lines.size()) {
            if (auto link = header_value(lines[pos + 1], "Lesson Link")) {
                lesson.link = non_empty(std::move(link));
                ++pos;
            }
        }
        parsed.course.lessons.push_back(std::move(lesson));
        current_lesson = number;
    }
    flush_section();

    return parsed;
}

}  // namespace courserag
