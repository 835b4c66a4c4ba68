#include "service/ingest_service.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "util/errors.hpp"
#include "util/log.hpp"

namespace courserag {
namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

IngestService::IngestService(CourseIndex& index, CourseChunker chunker)
    : index_(index), chunker_(std::move(chunker)) {}

IngestResult IngestService::ingest(const std::string& document_text) {
    auto chunked = chunker_.chunk(document_text);
    index_.replace_course(chunked.course, chunked.chunks);
    log::info("ingested course title=\"" + chunked.course.title + "\" lessons=" +
              std::to_string(chunked.course.lessons.size()) + " chunks=" + std::to_string(chunked.chunks.size()));
    return IngestResult{std::move(chunked.course), chunked.chunks.size()};
}

DirectoryIngestResult IngestService::ingest_directory(const std::string& path, bool clear_existing) {
    namespace fs = std::filesystem;
    if (!fs::is_directory(path)) {
        throw std::invalid_argument("not a directory: " + path);
    }

    if (clear_existing) {
        for (const auto& title : index_.course_titles()) {
            index_.remove_course(title);
        }
        log::info("cleared existing courses before folder ingest path=" + path);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(path)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    DirectoryIngestResult result;
    for (const auto& file : files) {
        ChunkedCourse chunked;
        try {
            chunked = chunker_.chunk(read_file(file));
        } catch (const ParseError& ex) {
            log::warn("skipping file=" + file.filename().string() + " parse error: " + ex.what());
            result.failed_files.push_back(file.filename().string());
            continue;
        }

        if (index_.has_course(chunked.course.title)) {
            log::info("course already indexed title=\"" + chunked.course.title + "\", skipping");
            result.skipped_existing.push_back(chunked.course.title);
            continue;
        }

        index_.replace_course(chunked.course, chunked.chunks);
        ++result.courses_added;
        result.chunks_added += chunked.chunks.size();
        log::info("ingested file=" + file.filename().string() + " title=\"" + chunked.course.title +
                  "\" chunks=" + std::to_string(chunked.chunks.size()));
    }

    log::info("folder ingest path=" + path + " courses_added=" + std::to_string(result.courses_added) +
              " chunks_added=" + std::to_string(result.chunks_added) +
              " skipped=" + std::to_string(result.skipped_existing.size()) +
              " failed=" + std::to_string(result.failed_files.size()));
    return result;
}

CourseAnalytics IngestService::analytics() {
    CourseAnalytics analytics;
    analytics.course_titles = index_.course_titles();
    analytics.total_courses = analytics.course_titles.size();
    return analytics;
}

}  // namespace courserag
