#pragma once

#include <optional>
#include <string>
#include <vector>

#include "index/course_index.hpp"
#include "model/course.hpp"
#include "service/course_name_resolver.hpp"

namespace courserag {

struct SearchRequest {
    std::string query;
    std::optional<std::string> course_name;
    std::optional<int> lesson_number;
};

struct SearchHit {
    std::string content;
    SourceAttribution source;
    double score = 0.0;
    int chunk_index = 0;
};

// Either hits (possibly none) or a recoverable error message meant for the
// generation service. Never both.
struct SearchResponse {
    std::vector<SearchHit> hits;
    std::optional<std::string> resolved_course;
    std::optional<std::string> error;

    bool ok() const noexcept { return !error.has_value(); }
};

class SearchService {
public:
    SearchService(CourseIndex& index, const CourseNameResolver& resolver, int max_results, double content_min_score);

    // Resolves course_name (if any) to its canonical title, filters Content by
    // that title and lesson_number, and attributes each hit. An unresolvable
    // course name yields an error response, not an exception.
    SearchResponse search(const SearchRequest& request);

    int max_results() const noexcept { return max_results_; }

private:
    CourseIndex& index_;
    const CourseNameResolver& resolver_;
    int max_results_;
    double content_min_score_;
};

// Renders a search response as the text handed back to the generation
// service: "[Course - Lesson N]" headers followed by chunk text, an
// explanatory marker for no results, or the error message.
std::string format_search_response(const SearchRequest& request, const SearchResponse& response);

}  // namespace courserag
