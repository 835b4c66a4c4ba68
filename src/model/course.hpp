#pragma once

#include <optional>
#include <string>
#include <vector>

namespace courserag {

struct Lesson {
    int number = 0;
    std::string title;
    std::optional<std::string> link;
};

// Identity is the canonical title.
struct Course {
    std::string title;
    std::optional<std::string> instructor;
    std::optional<std::string> link;
    std::vector<Lesson> lessons;

    const Lesson* find_lesson(int number) const {
        for (const auto& lesson : lessons) {
            if (lesson.number == number) {
                return &lesson;
            }
        }
        return nullptr;
    }
};

// Provenance of one retrieved piece of content. Lives for one query response.
struct SourceAttribution {
    std::string course_title;
    std::optional<int> lesson_number;
    std::optional<std::string> link;

    std::string label() const {
        if (lesson_number) {
            return course_title + " - Lesson " + std::to_string(*lesson_number);
        }
        return course_title;
    }

    bool operator==(const SourceAttribution&) const = default;
};

struct Exchange {
    std::string query;
    std::string answer;
};

}  // namespace courserag
