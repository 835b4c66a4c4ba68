#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "chunk/course_chunker.hpp"
#include "index/course_index.hpp"
#include "model/course.hpp"

namespace courserag {

struct IngestResult {
    Course course;
    std::size_t chunk_count = 0;
};

struct DirectoryIngestResult {
    std::size_t courses_added = 0;
    std::size_t chunks_added = 0;
    std::vector<std::string> skipped_existing;
    std::vector<std::string> failed_files;
};

struct CourseAnalytics {
    std::size_t total_courses = 0;
    std::vector<std::string> course_titles;
};

class IngestService {
public:
    IngestService(CourseIndex& index, CourseChunker chunker);

    // Parses, chunks and indexes one document, replacing any course with the
    // same title. Throws ParseError on a malformed document.
    IngestResult ingest(const std::string& document_text);

    // Ingests every *.txt file in the folder (sorted by name). Courses already
    // in the catalog are skipped unless clear_existing removed them first.
    // Malformed files are logged and skipped.
    DirectoryIngestResult ingest_directory(const std::string& path, bool clear_existing);

    CourseAnalytics analytics();

private:
    CourseIndex& index_;
    CourseChunker chunker_;
};

}  // namespace courserag
