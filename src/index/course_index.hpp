#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunk/chunk.hpp"
#include "embedding/embedder.hpp"
#include "index/vector_store.hpp"
#include "model/course.hpp"

namespace courserag {

struct CatalogMatch {
    Course course;
    double score = 0.0;
};

// Exact-match restriction on Content. Both fields set means AND.
struct ContentFilter {
    std::optional<std::string> course_title;
    std::optional<int> lesson_number;
};

struct ContentMatch {
    std::string content;
    std::string course_title;
    std::optional<int> lesson_number;
    int chunk_index = 0;
    double score = 0.0;
};

// The Catalog (one record per course, embedded from the title) and Content
// (one record per chunk, embedded from the chunk text) collections. The two
// are never queried against each other.
//
// Writers for one course are serialised by a per-course lock held across the
// whole replace. The clear-then-insert itself additionally holds the content
// lock exclusively, so readers see either the old or the new record set.
class CourseIndex {
public:
    static constexpr const char* kCatalogCollection = "course_catalog";
    static constexpr const char* kContentCollection = "course_content";

    CourseIndex(VectorStore& store, const Embedder& embedder);

    // Replaces the catalog record and every content record of the course.
    // Embeddings are computed before anything is touched; if a write fails
    // after the old content was cleared, the course is removed entirely.
    void replace_course(const Course& course, const std::vector<Chunk>& chunks);

    void remove_course(const std::string& course_title);

    std::vector<CatalogMatch> query_catalog(const std::string& text, int top_k);
    std::vector<ContentMatch> query_content(const std::string& text,
                                            int top_k,
                                            const ContentFilter& filter,
                                            std::optional<double> min_score);

    std::optional<Course> find_course(const std::string& course_title);
    bool has_course(const std::string& course_title);
    std::vector<std::string> course_titles();
    std::size_t content_count(const ContentFilter& filter = {});

private:
    struct PreparedCourse {
        VectorPoint catalog_point;
        std::vector<VectorPoint> content_points;
    };

    std::shared_ptr<std::mutex> course_lock(const std::string& course_title);
    VectorPoint prepare_catalog(const Course& course) const;
    std::vector<VectorPoint> prepare_content(const std::string& course_title, const std::vector<Chunk>& chunks) const;
    void write_content_locked(const std::string& course_title, const std::vector<VectorPoint>& points);
    void rollback_locked(const std::string& course_title);

    VectorStore& store_;
    const Embedder& embedder_;

    std::mutex course_locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> course_locks_;
    std::shared_mutex content_mutex_;
};

}  // namespace courserag
