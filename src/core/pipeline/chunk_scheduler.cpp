#include "chunk_scheduler.hpp"
#include <algorithm>
#include <thread>
#include <utility>

namespace hashdup::core {

namespace {

auto cancelled() -> infra::Error {
    return infra::make_error(infra::ErrorCode::Cancelled, "Run cancelled");
}

} // namespace

ChunkScheduler::ChunkScheduler(std::size_t chunk_size, YieldFn yield)
    : chunk_size_(chunk_size == 0 ? 1 : chunk_size)
    , yield_(yield ? std::move(yield) : YieldFn([] { std::this_thread::yield(); }))
{}

auto ChunkScheduler::chunk_count(std::size_t file_count) const -> std::size_t {
    return (file_count + chunk_size_ - 1) / chunk_size_;
}

auto ChunkScheduler::run(std::span<CandidateFile> files,
                         ProgressReporter& reporter,
                         const FileFn& on_file,
                         std::stop_token stop) const -> infra::VoidResult
{
    for (std::size_t begin = 0; begin < files.size(); begin += chunk_size_) {
        const auto chunk = files.subspan(begin, std::min(chunk_size_, files.size() - begin));

        for (std::size_t j = 0; j < chunk.size(); ++j) {
            if (stop.stop_requested()) {
                return std::unexpected(cancelled());
            }

            auto res = reporter.progress(begin + j + 1, chunk[j].name);
            if (!res) return res;

            on_file(chunk[j]);
        }

        // Уступаем поток между срезами
        yield_();
        if (stop.stop_requested()) {
            return std::unexpected(cancelled());
        }
    }
    return {};
}

} // namespace hashdup::core
