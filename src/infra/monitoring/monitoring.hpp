#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <thread>

namespace hashdup::infra {

// Отрисовка прогресса по сообщениям progress из конвейера.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        std::string current_file;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void update(std::uint64_t index, std::uint64_t total, std::string_view file_name);

    // Останавливает отрисовку и выводит финальную строку
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    [[nodiscard]] static auto format_line(const Stats& stats,
                                          std::chrono::steady_clock::time_point now) -> std::string;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> total_files_{0};
    mutable std::mutex name_mutex_;
    std::string current_file_;

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> finished_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace hashdup::infra
