#include "service/search_service.hpp"

#include <map>
#include <sstream>
#include <stdexcept>

#include "util/log.hpp"

namespace courserag {
namespace {

std::optional<std::string> attribution_link(const std::optional<Course>& course, std::optional<int> lesson_number) {
    if (!course) {
        return std::nullopt;
    }
    if (lesson_number) {
        if (const auto* lesson = course->find_lesson(*lesson_number); lesson != nullptr && lesson->link) {
            return lesson->link;
        }
    }
    return course->link;
}

}  // namespace

SearchService::SearchService(CourseIndex& index,
                             const CourseNameResolver& resolver,
                             int max_results,
                             double content_min_score)
    : index_(index),
      resolver_(resolver),
      max_results_(max_results),
      content_min_score_(content_min_score) {
    if (max_results_ <= 0) {
        throw std::invalid_argument("max_results must be positive");
    }
}

SearchResponse SearchService::search(const SearchRequest& request) {
    if (request.query.empty()) {
        throw std::invalid_argument("search query must not be empty");
    }

    SearchResponse response;
    if (request.lesson_number && *request.lesson_number < 0) {
        response.error = "Invalid lesson number " + std::to_string(*request.lesson_number) + ".";
        return response;
    }

    ContentFilter filter;
    if (request.course_name) {
        const auto resolved = resolver_.resolve(*request.course_name);
        if (!resolved) {
            log::warn("search: no matching course for '" + *request.course_name + "'");
            response.error = "No course found matching '" + *request.course_name + "'.";
            return response;
        }
        response.resolved_course = resolved->title;
        filter.course_title = resolved->title;
    }
    filter.lesson_number = request.lesson_number;

    const auto matches = index_.query_content(request.query, max_results_, filter, content_min_score_);

    std::map<std::string, std::optional<Course>> catalog_cache;
    response.hits.reserve(matches.size());
    for (const auto& match : matches) {
        auto [it, inserted] = catalog_cache.try_emplace(match.course_title);
        if (inserted) {
            it->second = index_.find_course(match.course_title);
        }

        SearchHit hit;
        hit.content = match.content;
        hit.score = match.score;
        hit.chunk_index = match.chunk_index;
        hit.source = SourceAttribution{
            .course_title = match.course_title,
            .lesson_number = match.lesson_number,
            .link = attribution_link(it->second, match.lesson_number),
        };
        response.hits.push_back(std::move(hit));
    }

    std::ostringstream oss;
    oss << "search: query=\"" << request.query << "\" course=" << response.resolved_course.value_or("*")
        << " lesson=" << (request.lesson_number ? std::to_string(*request.lesson_number) : "*")
        << " hits=" << response.hits.size();
    log::debug(oss.str());
    return response;
}

std::string format_search_response(const SearchRequest& request, const SearchResponse& response) {
    if (response.error) {
        return *response.error;
    }

    if (response.hits.empty()) {
        std::string marker = "No relevant content found";
        if (response.resolved_course) {
            marker += " in course '" + *response.resolved_course + "'";
        } else if (request.course_name) {
            marker += " in course '" + *request.course_name + "'";
        }
        if (request.lesson_number) {
            marker += " in lesson " + std::to_string(*request.lesson_number);
        }
        return marker + ".";
    }

    std::ostringstream oss;
    for (std::size_t i = 0; i < response.hits.size(); ++i) {
        const auto& hit = response.hits[i];
        oss << '[' << hit.source.label() << "]\n" << hit.content;
        if (i + 1 < response.hits.size()) {
            oss << "\n\n";
        }
    }
    return oss.str();
}

}  // namespace courserag
