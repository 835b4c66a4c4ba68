#include "service/course_name_resolver.hpp"

#include <cctype>
#include <sstream>

#include "util/log.hpp"

namespace courserag {
namespace {

bool is_blank(const std::string& value) {
    for (const unsigned char ch : value) {
        if (!std::isspace(ch)) {
            return false;
        }
    }
    return true;
}

}  // namespace

CourseNameResolver::CourseNameResolver(CourseIndex& index, double min_score) : index_(index), min_score_(min_score) {}

std::optional<ResolvedCourse> CourseNameResolver::best_match(const std::string& fuzzy_name) const {
    if (is_blank(fuzzy_name)) {
        return std::nullopt;
    }
    const auto matches = index_.query_catalog(fuzzy_name, 1);
    if (matches.empty()) {
        return std::nullopt;
    }
    return ResolvedCourse{matches.front().course.title, matches.front().score};
}

std::optional<ResolvedCourse> CourseNameResolver::resolve(const std::string& fuzzy_name) const {
    auto match = best_match(fuzzy_name);
    if (!match) {
        log::debug("course resolution: no catalog entry for '" + fuzzy_name + "'");
        return std::nullopt;
    }
    if (match->score < min_score_) {
        std::ostringstream oss;
        oss << "course resolution: '" << fuzzy_name << "' best match '" << match->title << "' score=" << match->score
            << " below min_score=" << min_score_;
        log::debug(oss.str());
        return std::nullopt;
    }
    return match;
}

}  // namespace courserag
