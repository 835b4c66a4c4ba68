#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/course.hpp"

namespace courserag {

// Body text owned by one lesson, or by the course itself when it precedes the
// first lesson heading.
struct LessonSection {
    std::optional<int> lesson_number;
    std::string body;
};

struct ParsedCourse {
    Course course;
    std::vector<LessonSection> sections;
};

// Parses the line-structured course format:
//
//   Course Title: <title>
//   Course Link: <url>
//   Course Instructor: <name>
//
//   Lesson 1: <title>
//   Lesson Link: <url>
//   <body...>
//
// Throws ParseError when the header block carries no course title or a lesson
// number repeats.
ParsedCourse parse_course_document(const std::string& text);

}  // namespace courserag
