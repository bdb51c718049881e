#include <fmt/core.h>
#include <fmt/ranges.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/hash/digest_engine.hpp"
#include "infra/interrupt.hpp"
#include "infra/logging/logging.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/fs.hpp"
#include "core/pipeline/duplicate_grouper.hpp"
#include "core/pipeline/message_codec.hpp"
#include "core/worker/pipeline_worker.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <variant>

using GIT = hashdup::build_info::GitInfo;
using ARGS = hashdup::args_parser::CLIArgs;

constexpr auto load_from_cli = hashdup::infra::config_from_cli;
constexpr auto load_config_file = hashdup::infra::load_config_from_file;
constexpr auto args_parser = hashdup::args_parser::parse_args;
constexpr auto git = hashdup::build_info::get_git_info();

namespace core = hashdup::core;
namespace infra = hashdup::infra;

static auto
log_build_info(const GIT& git)
-> void {
    spdlog::debug("hashdup {} ({}@{}{}), built {}",
                  git.version, git.branch, git.commit_short,
                  git.dirty ? "-dirty" : "", git.timestamp);
}

static auto
log_args(const ARGS& args)
-> void {
    spdlog::debug("Paths: {}", args.paths);
    spdlog::debug("Recursive: {}", args.recursive ? "yes" : "no");
    spdlog::debug("Images only: {}", args.images_only ? "yes" : "no");
    spdlog::debug("Exclude: {}", args.exclude_patterns);
    spdlog::debug("Chunk size: {}", args.chunk_size ? fmt::to_string(*args.chunk_size) : "default");
    spdlog::debug("Algorithm: {}", args.algorithm.value_or("default"));
    spdlog::debug("Format: {}", args.format);
}

static auto
print_report(const std::vector<core::DuplicateGroup>& groups,
             const std::vector<core::ProcessingError>& errors)
-> void {
    for (const auto& group : groups) {
        fmt::print("{} {} ({} files, {} bytes each)\n",
                   group.id, group.hash, group.files.size(), group.size);
        for (std::size_t i = 0; i < group.files.size(); ++i) {
            fmt::print("  {} {}\n", i == 0 ? "keep" : "dupe", group.files[i].path);
        }
    }

    if (!errors.empty()) {
        fmt::print("\nErrors ({}):\n", errors.size());
        for (const auto& err : errors) {
            fmt::print("  {}: {}\n", err.path, err.error);
        }
    }

    const auto summary = core::summarize(groups);
    fmt::print("\nFound {} duplicates in {} groups. Potential space to save: {:.2f} MB\n",
               summary.duplicate_file_count, summary.group_count,
               summary.wasted_bytes / 1024.0 / 1024.0);
}

int main(int argc, char** argv)
{
    try {
        infra::configure_default_logger(spdlog::level::info);
        infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return hashdup::args_parser::last_parse_exit_code(); // --help или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = args.config_path ? infra::load_config(*args.config_path) : load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));
        if (auto valid = config.validate(); !valid) {
            spdlog::error("Config error: {}", valid.error());
            return 1;
        }

        if (config.log_level) {
            spdlog::set_level(*infra::parse_log_level(*config.log_level));
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        log_build_info(git);
        log_args(args);

        const bool yaml_output = args.format == "yaml";
        const auto algorithm = infra::parse_digest_algorithm(config.algorithm.value_or("sha256"));
        if (!algorithm) {
            return infra::log_and_return(infra::Error(algorithm.error())).to_exit_code();
        }

        // Сбор кандидатов (хост)
        std::vector<std::filesystem::path> roots(args.paths.begin(), args.paths.end());
        auto paths = hashdup::adapters::fs::collect_files(roots, hashdup::adapters::fs::ScanOptions{
            .recursive = config.recursive,
            .follow_symlinks = config.follow_symlinks,
            .images_only = config.images_only,
            .exclude_patterns = config.exclude_patterns
        });
        if (!paths) {
            return infra::log_and_return(std::move(paths.error())).to_exit_code();
        }
        spdlog::info("Found {} candidate files", paths->size());

        core::ProcessFilesRequest request;
        request.files = hashdup::adapters::fs::load_candidates(*paths);

        core::PipelineWorker worker(core::PipelineWorker::Options{
            .orchestrator = core::OrchestratorOptions{
                .chunk_size = config.chunk_size.value_or(core::ChunkScheduler::DEFAULT_CHUNK_SIZE),
                .algorithm = *algorithm,
                .yield = {}
            },
            .logger = spdlog::default_logger(),
            .launcher = {}
        });

        infra::ProgressMonitor monitor(config.progress && !yaml_output, config.quiet);

        auto start_time = std::chrono::steady_clock::now();
        if (auto posted = worker.post(std::move(request)); !posted) {
            return infra::log_and_return(std::move(posted.error())).to_exit_code();
        }

        std::vector<core::ProcessingError> errors;
        std::vector<core::DuplicateGroup> groups;
        std::optional<std::string> fatal;

        while (true) {
            if (infra::is_interrupted()) {
                worker.terminate();
                monitor.finish();
                spdlog::warn("Interrupted, scan aborted");
                return 130;
            }

            auto message = worker.receive_for(std::chrono::milliseconds(100));
            if (!message) {
                continue;
            }

            if (yaml_output) {
                fmt::print("{}", core::codec::to_yaml(*message));
            }

            if (auto* progress = std::get_if<core::ProgressMessage>(&*message)) {
                monitor.update(progress->index, progress->total, progress->file_name);
            } else if (auto* reported = std::get_if<core::ErrorsMessage>(&*message)) {
                errors = std::move(reported->errors);
            } else if (auto* completed = std::get_if<core::CompletedMessage>(&*message)) {
                groups = std::move(completed->groups);
                break;
            } else if (auto* failed = std::get_if<core::FailedMessage>(&*message)) {
                fatal = failed->error;
                break;
            }
        }
        monitor.finish();

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (fatal) {
            spdlog::error("Duplicate detection failed: {}", *fatal);
            return 1;
        }

        if (!yaml_output) {
            print_report(groups, errors);
        }
        spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);

        if (!errors.empty()) {
            spdlog::warn("Processing completed with {} errors", errors.size());
            return 2;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
