#include "index/course_index.hpp"

#include <algorithm>
#include <stdexcept>

#include "util/hash.hpp"
#include "util/log.hpp"

namespace courserag {
namespace {

constexpr std::size_t kMaxCatalogScan = 10000;

std::uint64_t catalog_point_id(const std::string& course_title) {
    return hash::stable_point_id("catalog:" + course_title);
}

std::uint64_t content_point_id(const std::string& course_title, int chunk_index) {
    return hash::stable_point_id("content:" + course_title + ":" + std::to_string(chunk_index));
}

nlohmann::json optional_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optional_string(const nlohmann::json& payload, const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

nlohmann::json catalog_payload(const Course& course) {
    nlohmann::json lessons = nlohmann::json::array();
    for (const auto& lesson : course.lessons) {
        lessons.push_back({
            {"lesson_number", lesson.number},
            {"lesson_title", lesson.title},
            {"lesson_link", optional_json(lesson.link)},
        });
    }
    return nlohmann::json{
        {"title", course.title},
        {"instructor", optional_json(course.instructor)},
        {"course_link", optional_json(course.link)},
        {"lesson_count", course.lessons.size()},
        {"lessons", lessons},
    };
}

Course course_from_payload(const nlohmann::json& payload) {
    Course course;
    course.title = payload.value("title", std::string{});
    course.instructor = optional_string(payload, "instructor");
    course.link = optional_string(payload, "course_link");
    if (const auto it = payload.find("lessons"); it != payload.end() && it->is_array()) {
        for (const auto& item : *it) {
            Lesson lesson;
            lesson.number = item.value("lesson_number", 0);
            lesson.title = item.value("lesson_title", std::string{});
            lesson.link = optional_string(item, "lesson_link");
            course.lessons.push_back(std::move(lesson));
        }
    }
    return course;
}

PayloadFilter to_payload_filter(const ContentFilter& filter) {
    PayloadFilter payload_filter;
    if (filter.course_title) {
        payload_filter.where("course_title", *filter.course_title);
    }
    if (filter.lesson_number) {
        payload_filter.where("lesson_number", *filter.lesson_number);
    }
    return payload_filter;
}

}  // namespace

CourseIndex::CourseIndex(VectorStore& store, const Embedder& embedder) : store_(store), embedder_(embedder) {
    store_.ensure_collection(kCatalogCollection, embedder_.dimension());
    store_.ensure_collection(kContentCollection, embedder_.dimension());
}

std::shared_ptr<std::mutex> CourseIndex::course_lock(const std::string& course_title) {
    std::lock_guard<std::mutex> lock(course_locks_mutex_);
    auto& slot = course_locks_[course_title];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

VectorPoint CourseIndex::prepare_catalog(const Course& course) const {
    if (course.title.empty()) {
        throw std::invalid_argument("course title must not be empty");
    }
    auto vector = embedder_.embed(course.title);
    if (vector.empty()) {
        throw std::runtime_error("embedding returned empty vector for course title");
    }
    return VectorPoint{catalog_point_id(course.title), std::move(vector), catalog_payload(course)};
}

std::vector<VectorPoint> CourseIndex::prepare_content(const std::string& course_title,
                                                      const std::vector<Chunk>& chunks) const {
    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.course_title != course_title) {
            throw std::invalid_argument("chunk belongs to '" + chunk.course_title + "', expected '" + course_title +
                                        "'");
        }
        if (chunk.chunk_index != static_cast<int>(i)) {
            throw std::invalid_argument("chunk indices must be contiguous from 0 for course '" + course_title + "'");
        }
        texts.push_back(chunk.content);
    }

    auto vectors = embedder_.embed_batch(texts);
    if (vectors.size() != chunks.size()) {
        throw std::runtime_error("embedding count mismatch for course '" + course_title + "'");
    }

    std::vector<VectorPoint> points;
    points.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        nlohmann::json payload = {
            {"course_title", chunk.course_title},
            {"lesson_number", chunk.lesson_number ? nlohmann::json(*chunk.lesson_number) : nlohmann::json(nullptr)},
            {"chunk_index", chunk.chunk_index},
            {"content", chunk.content},
            {"content_sha256", chunk.content_sha256},
        };
        points.push_back(VectorPoint{content_point_id(course_title, chunk.chunk_index), std::move(vectors[i]),
                                     std::move(payload)});
    }
    return points;
}

void CourseIndex::write_content_locked(const std::string& course_title, const std::vector<VectorPoint>& points) {
    store_.delete_where(kContentCollection, PayloadFilter{}.where("course_title", course_title));
    if (!points.empty()) {
        store_.upsert(kContentCollection, points);
    }
}

void CourseIndex::rollback_locked(const std::string& course_title) {
    try {
        store_.delete_where(kContentCollection, PayloadFilter{}.where("course_title", course_title));
        store_.delete_points(kCatalogCollection, {catalog_point_id(course_title)});
        log::warn("rolled back partially written course '" + course_title + "'");
    } catch (const std::exception& ex) {
        log::error("rollback of course '" + course_title + "' failed: " + ex.what());
    }
}

void CourseIndex::replace_course(const Course& course, const std::vector<Chunk>& chunks) {
    const auto lock_for_course = course_lock(course.title);
    std::lock_guard<std::mutex> course_guard(*lock_for_course);

    PreparedCourse prepared{prepare_catalog(course), prepare_content(course.title, chunks)};

    std::unique_lock<std::shared_mutex> write_guard(content_mutex_);
    try {
        write_content_locked(course.title, prepared.content_points);
        store_.upsert(kCatalogCollection, {prepared.catalog_point});
    } catch (...) {
        rollback_locked(course.title);
        throw;
    }
}

void CourseIndex::remove_course(const std::string& course_title) {
    const auto lock_for_course = course_lock(course_title);
    std::lock_guard<std::mutex> course_guard(*lock_for_course);

    std::unique_lock<std::shared_mutex> write_guard(content_mutex_);
    store_.delete_where(kContentCollection, PayloadFilter{}.where("course_title", course_title));
    store_.delete_points(kCatalogCollection, {catalog_point_id(course_title)});
}

std::vector<CatalogMatch> CourseIndex::query_catalog(const std::string& text, int top_k) {
    const auto vector = embedder_.embed(text);
    if (vector.empty()) {
        return {};
    }

    std::shared_lock<std::shared_mutex> read_guard(content_mutex_);
    const auto points = store_.search(kCatalogCollection, vector, top_k, PayloadFilter{}, std::nullopt);

    std::vector<CatalogMatch> matches;
    matches.reserve(points.size());
    for (const auto& point : points) {
        matches.push_back(CatalogMatch{course_from_payload(point.payload), point.score});
    }
    return matches;
}

std::vector<ContentMatch> CourseIndex::query_content(const std::string& text,
                                                     int top_k,
                                                     const ContentFilter& filter,
                                                     std::optional<double> min_score) {
    const auto vector = embedder_.embed(text);
    if (vector.empty()) {
        return {};
    }

    std::shared_lock<std::shared_mutex> read_guard(content_mutex_);
    const auto points = store_.search(kContentCollection, vector, top_k, to_payload_filter(filter), min_score);

    std::vector<ContentMatch> matches;
    matches.reserve(points.size());
    for (const auto& point : points) {
        ContentMatch match;
        match.content = point.payload.value("content", std::string{});
        match.course_title = point.payload.value("course_title", std::string{});
        if (const auto it = point.payload.find("lesson_number"); it != point.payload.end() && it->is_number_integer()) {
            match.lesson_number = it->get<int>();
        }
        match.chunk_index = point.payload.value("chunk_index", 0);
        match.score = point.score;
        matches.push_back(std::move(match));
    }
    return matches;
}

std::optional<Course> CourseIndex::find_course(const std::string& course_title) {
    std::shared_lock<std::shared_mutex> read_guard(content_mutex_);
    auto payload = store_.get_payload(kCatalogCollection, catalog_point_id(course_title));
    if (!payload) {
        return std::nullopt;
    }
    return course_from_payload(*payload);
}

bool CourseIndex::has_course(const std::string& course_title) { return find_course(course_title).has_value(); }

std::vector<std::string> CourseIndex::course_titles() {
    std::shared_lock<std::shared_mutex> read_guard(content_mutex_);
    std::vector<std::string> titles;
    for (const auto& payload : store_.scroll(kCatalogCollection, PayloadFilter{}, kMaxCatalogScan)) {
        if (auto title = optional_string(payload, "title")) {
            titles.push_back(std::move(*title));
        }
    }
    std::sort(titles.begin(), titles.end());
    return titles;
}

std::size_t CourseIndex::content_count(const ContentFilter& filter) {
    std::shared_lock<std::shared_mutex> read_guard(content_mutex_);
    return store_.count(kContentCollection, to_payload_filter(filter));
}

}  // namespace courserag
