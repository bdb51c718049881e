#include "monitoring.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <thread>

namespace hashdup::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::update(std::uint64_t index, std::uint64_t total, std::string_view file_name) {
    total_files_.store(total);
    processed_files_.store(index);
    std::lock_guard lock(name_mutex_);
    current_file_.assign(file_name);
}

void ProgressMonitor::finish() {
    if (finished_.exchange(true)) {
        return;
    }
    stop_rendering_thread_();
    if (enabled_ && total_files_.load() > 0) {
        render_();
        std::cerr << "\n"; // финальный перенос
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    std::lock_guard lock(name_mutex_);
    return Stats{
        .total_files = total_files_.load(),
        .processed_files = processed_files_.load(),
        .current_file = current_file_,
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // jthread выполнит join()
    }
}

auto ProgressMonitor::format_line(const Stats& stats, std::chrono::steady_clock::time_point now)
    -> std::string
{
    const double progress = stats.total_files == 0
        ? 0.0
        : static_cast<double>(stats.processed_files) / static_cast<double>(stats.total_files);
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(progress * bar_width));

    const auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    const double files_per_sec = elapsed_sec > 0 ? stats.processed_files / elapsed_sec : 0.0;

    // ETA
    std::string eta_str = "inf";
    if (files_per_sec > 0) {
        const double eta_sec = (stats.total_files - stats.processed_files) / files_per_sec;
        if (std::isfinite(eta_sec) && eta_sec >= 0) {
            int seconds = static_cast<int>(eta_sec);
            int hours = seconds / 3600;
            int minutes = (seconds % 3600) / 60;
            seconds = seconds % 60;
            eta_str = hours > 0 ? fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds)
                                : fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    return fmt::format("[{}] {}/{} files | {:.1f} files/s | ETA: {} | {}",
                       bar, stats.processed_files, stats.total_files,
                       files_per_sec, eta_str, stats.current_file);
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    auto stats = get_stats();
    if (stats.total_files == 0) return;

    // ANSI: очистить строку
    std::cerr << "\r\033[K" << format_line(stats, std::chrono::steady_clock::now()) << std::flush;
}

} // namespace hashdup::infra
