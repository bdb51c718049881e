#include "orchestrator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <utility>
#include "reporter.hpp"
#include "../../infra/logging/logging.hpp"

namespace hashdup::core {

using infra::ErrorCode;
using infra::make_error;

Orchestrator::Orchestrator(OrchestratorOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options))
    , digest_(options_.algorithm)
    , logger_(logger ? std::move(logger) : infra::make_null_logger("hashdup.pipeline"))
{}

auto Orchestrator::fail_(ProgressReporter& reporter, infra::Error&& err) const -> RunState {
    logger_->error("Run failed: {}: {}", infra::to_string(err.code), err.message);
    auto res = reporter.fail(err.message);
    if (!res) {
        logger_->debug("Failure was not delivered: {}", res.error().message);
    }
    return reporter.state();
}

auto Orchestrator::run(ProcessFilesRequest request, MessageSink& sink, std::stop_token stop) -> RunState {
    ProgressReporter reporter(sink);

    if (request.type != PROCESS_FILES_TYPE) {
        return fail_(reporter, make_error(ErrorCode::MalformedRequest,
            fmt::format("Unsupported message type: '{}'", request.type)));
    }
    if (!request.files) {
        return fail_(reporter, make_error(ErrorCode::MalformedRequest,
            "Malformed request: missing 'files' field"));
    }

    // Файлы принадлежат прогону и освобождаются при выходе
    auto files = std::move(*request.files);

    if (files.empty()) {
        logger_->info("Empty file list, nothing to process");
        auto res = reporter.complete({}, {});
        if (!res && res.error().code != ErrorCode::Cancelled) {
            return fail_(reporter, std::move(res.error()));
        }
        return reporter.state();
    }

    const ChunkScheduler scheduler(options_.chunk_size, options_.yield);
    logger_->info("Processing {} files in chunks of {} ({})",
                  files.size(), scheduler.chunk_size(), infra::to_string(digest_.algorithm()));

    if (auto res = reporter.begin(files.size()); !res) {
        return fail_(reporter, std::move(res.error()));
    }

    DuplicateGrouper grouper;
    ErrorCollector errors;
    std::size_t position = 0;

    auto res = scheduler.run(files, reporter, [&](CandidateFile& file) {
        if (position % scheduler.chunk_size() == 0) {
            logger_->debug("Processing chunk {}/{}",
                           position / scheduler.chunk_size() + 1, scheduler.chunk_count(files.size()));
        }
        ++position;
        process_file_(file, grouper, errors, stop);
    }, stop);

    if (!res) {
        if (res.error().code == ErrorCode::Cancelled) {
            logger_->info("Run cancelled after {} of {} files", position, files.size());
            return reporter.state();
        }
        return fail_(reporter, std::move(res.error()));
    }

    auto groups = grouper.finalize();
    const auto summary = summarize(groups);
    logger_->info("Processing completed: {} files hashed, {} errors, {} unique",
                  grouper.file_count(), errors.size(), grouper.unique_count());
    logger_->info("Found {} duplicate groups ({} redundant files, {} bytes)",
                  summary.group_count, summary.duplicate_file_count, summary.wasted_bytes);
    if (!errors.empty()) {
        logger_->warn("Reporting {} errors", errors.size());
    }

    if (auto done = reporter.complete(std::move(groups), errors.take()); !done) {
        if (done.error().code == ErrorCode::Cancelled) {
            return reporter.state();
        }
        return fail_(reporter, std::move(done.error()));
    }
    return reporter.state();
}

void Orchestrator::process_file_(CandidateFile& file, DuplicateGrouper& grouper, ErrorCollector& errors,
                                 const std::stop_token& stop) const {
    auto digest = digest_.hash(file.content, stop);
    if (!digest && digest.error().code == ErrorCode::Cancelled) {
        return; // прогон отменён, планировщик остановится на следующей проверке
    }
    if (!digest) {
        auto message = (!file.content && !file.content_error.empty())
            ? fmt::format("Failed to hash file: {}", file.content_error)
            : std::move(digest.error().message);
        logger_->warn("Could not process file {}: {}", file.name, message);
        errors.record(file.path, file.name, message);
        return;
    }

    grouper.add(HashedFile{
        .path = file.path,
        .name = file.name,
        .size = file.size,
        .mime_type = file.mime_type,
        .hash = std::move(*digest)
    });
    file.content.reset(); // содержимое больше не нужно
}

} // namespace hashdup::core
