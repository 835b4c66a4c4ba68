#pragma once

#include <optional>
#include <string>

#include "index/course_index.hpp"

namespace courserag {

struct ResolvedCourse {
    std::string title;
    double score = 0.0;
};

// Maps an imprecise course name to one canonical title through a top-1
// Catalog similarity lookup. No disambiguation between close candidates.
class CourseNameResolver {
public:
    CourseNameResolver(CourseIndex& index, double min_score);

    // Empty when the catalog is empty or the best match scores below the
    // minimum confidence.
    std::optional<ResolvedCourse> resolve(const std::string& fuzzy_name) const;

    // Best catalog match regardless of the threshold.
    std::optional<ResolvedCourse> best_match(const std::string& fuzzy_name) const;

    double min_score() const noexcept { return min_score_; }

private:
    CourseIndex& index_;
    double min_score_;
};

}  // namespace courserag
