#include "app/services.hpp"
#include "config/config.hpp"
#include "http/internal_server.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include "version.hpp"
#include "worker/kafka_executor.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace courserag {
namespace {

constexpr std::size_t kContentPreviewLength = 200;

enum class Mode { None, Serve, KafkaWorker, Ingest, IngestDir, Courses, Search, Ask };

struct CliOptions {
    Mode mode = Mode::None;
    std::string argument;
    bool clear = false;
    std::optional<std::string> course;
    std::optional<int> lesson;
    std::string session_id;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void print_usage() {
    std::cerr << "usage: course-rag <mode>\n"
                 "  --serve\n"
                 "  --kafka-worker\n"
                 "  --ingest <file>\n"
                 "  --ingest-dir <dir> [--clear]\n"
                 "  --courses\n"
                 "  --search <query> [--course <name>] [--lesson <n>]\n"
                 "  --ask <question> [--session <id>]\n";
}

std::string truncate_content(const std::string& content) {
    if (content.size() <= kContentPreviewLength) {
        return content;
    }
    return content.substr(0, kContentPreviewLength - 3) + "...";
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

CliOptions parse_arguments(int argc, char** argv) {
    CliOptions options;
    auto next_value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError(std::string{flag} + " requires a value");
        }
        return argv[++i];
    };
    auto set_mode = [&](Mode mode) {
        if (options.mode != Mode::None) {
            throw UsageError("only one mode may be given");
        }
        options.mode = mode;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--serve") {
            set_mode(Mode::Serve);
        } else if (arg == "--kafka-worker") {
            set_mode(Mode::KafkaWorker);
        } else if (arg == "--ingest") {
            set_mode(Mode::Ingest);
            options.argument = next_value(i, arg);
        } else if (arg == "--ingest-dir") {
            set_mode(Mode::IngestDir);
            options.argument = next_value(i, arg);
        } else if (arg == "--courses") {
            set_mode(Mode::Courses);
        } else if (arg == "--search") {
            set_mode(Mode::Search);
            options.argument = next_value(i, arg);
        } else if (arg == "--ask") {
            set_mode(Mode::Ask);
            options.argument = next_value(i, arg);
        } else if (arg == "--clear") {
            options.clear = true;
        } else if (arg == "--course") {
            options.course = next_value(i, arg);
        } else if (arg == "--lesson") {
            const auto value = next_value(i, arg);
            try {
                std::size_t consumed = 0;
                options.lesson = std::stoi(value, &consumed);
                if (consumed != value.size()) {
                    throw UsageError("--lesson requires an integer value");
                }
            } catch (const std::logic_error&) {
                throw UsageError("--lesson requires an integer value");
            }
        } else if (arg == "--session") {
            options.session_id = next_value(i, arg);
        } else {
            throw UsageError("unknown argument: " + std::string{arg});
        }
    }

    if (options.mode == Mode::None) {
        throw UsageError("no mode given");
    }
    if (options.clear && options.mode != Mode::IngestDir) {
        throw UsageError("--clear only applies to --ingest-dir");
    }
    if ((options.course || options.lesson) && options.mode != Mode::Search) {
        throw UsageError("--course and --lesson only apply to --search");
    }
    if (!options.session_id.empty() && options.mode != Mode::Ask) {
        throw UsageError("--session only applies to --ask");
    }
    return options;
}

int run_ingest(Services& services, const std::string& path) {
    const auto result = services.ingest->ingest(read_file(path));
    std::cout << "Ingested \"" << result.course.title << "\": " << result.course.lessons.size() << " lessons, "
              << result.chunk_count << " chunks\n";
    return 0;
}

int run_ingest_dir(Services& services, const std::string& path, bool clear) {
    const auto result = services.ingest->ingest_directory(path, clear);
    std::cout << "Added " << result.courses_added << " courses with " << result.chunks_added << " chunks\n";
    for (const auto& title : result.skipped_existing) {
        std::cout << "  skipped (already indexed): " << title << "\n";
    }
    for (const auto& file : result.failed_files) {
        std::cout << "  failed to parse: " << file << "\n";
    }
    return 0;
}

int run_courses(Services& services) {
    const auto analytics = services.ingest->analytics();
    std::cout << "Total courses: " << analytics.total_courses << "\n";
    for (const auto& title : analytics.course_titles) {
        std::cout << "- " << title << "\n";
    }
    return 0;
}

int run_search(Services& services, const CliOptions& options) {
    const SearchRequest request{options.argument, options.course, options.lesson};
    const auto response = services.search->search(request);
    if (!response.ok()) {
        std::cout << *response.error << "\n";
        return 0;
    }
    if (response.resolved_course) {
        std::cout << "course=\"" << *response.resolved_course << "\"\n";
    }
    int rank = 1;
    for (const auto& hit : response.hits) {
        std::cout << "#" << rank++ << " score=" << hit.score << " [" << hit.source.label() << "]";
        if (hit.source.link) {
            std::cout << " " << *hit.source.link;
        }
        std::cout << "\n" << truncate_content(hit.content) << "\n";
    }
    if (response.hits.empty()) {
        std::cout << format_search_response(request, response) << "\n";
    }
    return 0;
}

int run_ask(Services& services, const CliOptions& options) {
    const auto response = services.orchestrator->query(options.session_id, options.argument);
    std::cout << response.answer << "\n\nSources:\n";
    if (response.sources.empty()) {
        std::cout << "- (none)\n";
    }
    for (const auto& source : response.sources) {
        std::cout << "- " << source.label();
        if (source.link) {
            std::cout << " (" << *source.link << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\nsession=" << response.session_id << (response.partial ? " (partial answer)" : "") << "\n";
    return 0;
}

int run_serve(const Config& config, Services& services) {
    const auto& docs_dir = config.docs_dir();
    if (!docs_dir.empty() && std::filesystem::is_directory(docs_dir)) {
        services.ingest->ingest_directory(docs_dir, false);
    } else {
        log::warn("docs directory not found, starting with the existing index path=" + docs_dir);
    }
    return run_http_server(services, config.http_host(), config.http_port());
}

int run(const Config& config, const CliOptions& options) {
    const bool with_generation =
        options.mode == Mode::Ask || options.mode == Mode::Serve || options.mode == Mode::KafkaWorker;
    auto services = build_services(config, with_generation);

    switch (options.mode) {
    case Mode::Serve:
        return run_serve(config, *services);
    case Mode::KafkaWorker:
        return run_kafka_executor(config, *services);
    case Mode::Ingest:
        return run_ingest(*services, options.argument);
    case Mode::IngestDir:
        return run_ingest_dir(*services, options.argument, options.clear);
    case Mode::Courses:
        return run_courses(*services);
    case Mode::Search:
        return run_search(*services, options);
    case Mode::Ask:
        return run_ask(*services, options);
    case Mode::None:
        break;
    }
    return 1;
}

}  // namespace
}  // namespace courserag

int main(int argc, char** argv) {
    courserag::CliOptions options;
    try {
        options = courserag::parse_arguments(argc, argv);
    } catch (const courserag::UsageError& ex) {
        courserag::log::error(ex.what());
        courserag::print_usage();
        return 1;
    }

    std::optional<courserag::Config> config;
    try {
        config.emplace(courserag::Config::load());
        courserag::log::set_threshold(courserag::log::parse_level(config->log_level()));
    } catch (const courserag::ConfigError& ex) {
        courserag::log::error(std::string{"configuration error: "} + ex.what());
        return 1;
    }
    courserag::log::info(std::string{"course-rag starting (version "} + courserag::kVersion + ')');

    try {
        return courserag::run(*config, options);
    } catch (const courserag::ConfigError& ex) {
        courserag::log::error(std::string{"configuration error: "} + ex.what());
        return 1;
    } catch (const courserag::ParseError& ex) {
        courserag::log::error(std::string{"parse error: "} + ex.what());
        return 2;
    } catch (const std::exception& ex) {
        courserag::log::error(std::string{"fatal error: "} + ex.what());
        return 2;
    }
}
