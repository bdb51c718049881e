#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <stop_token>
#include "reporter.hpp"
#include "types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace hashdup::core {

/// Обрабатывает файлы последовательными срезами по chunk_size штук.
///
/// Перед каждым файлом отправляет progress (индекс 1..N), после каждого
/// среза уступает поток планировщику. Порядок входа сохраняется.
class ChunkScheduler {
public:
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 50;

    using YieldFn = std::function<void()>;
    using FileFn = std::function<void(CandidateFile&)>;

    explicit ChunkScheduler(std::size_t chunk_size = DEFAULT_CHUNK_SIZE, YieldFn yield = {});

    [[nodiscard]] auto run(std::span<CandidateFile> files,
                           ProgressReporter& reporter,
                           const FileFn& on_file,
                           std::stop_token stop = {}) const -> infra::VoidResult;

    [[nodiscard]] auto chunk_size() const -> std::size_t { return chunk_size_; }
    [[nodiscard]] auto chunk_count(std::size_t file_count) const -> std::size_t;

private:
    std::size_t chunk_size_;
    YieldFn yield_;
};

} // namespace hashdup::core
