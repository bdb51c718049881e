#pragma once

#include <cstddef>
#include <memory>
#include <stop_token>
#include <spdlog/logger.h>
#include "chunk_scheduler.hpp"
#include "duplicate_grouper.hpp"
#include "error_collector.hpp"
#include "messages.hpp"
#include "types.hpp"
#include "../../infra/hash/digest_engine.hpp"

namespace hashdup::core {

struct OrchestratorOptions {
    std::size_t chunk_size = ChunkScheduler::DEFAULT_CHUNK_SIZE;
    infra::DigestAlgorithm algorithm = infra::DigestAlgorithm::Sha256;
    ChunkScheduler::YieldFn yield; // пусто = std::this_thread::yield
};

/// Проводит один прогон: проверка запроса, хеширование по срезам,
/// группировка и отправка errors/completed или error.
class Orchestrator {
public:
    explicit Orchestrator(OrchestratorOptions options = {},
                          std::shared_ptr<spdlog::logger> logger = nullptr);

    // При отмене возвращает состояние processing и больше ничего не отправляет
    auto run(ProcessFilesRequest request, MessageSink& sink, std::stop_token stop = {}) -> RunState;

    [[nodiscard]] auto options() const -> const OrchestratorOptions& { return options_; }

private:
    void process_file_(CandidateFile& file, DuplicateGrouper& grouper, ErrorCollector& errors,
                       const std::stop_token& stop) const;
    auto fail_(ProgressReporter& reporter, infra::Error&& err) const -> RunState;

    OrchestratorOptions options_;
    infra::DigestEngine digest_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace hashdup::core
