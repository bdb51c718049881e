#pragma once

#include <atomic>
#include <csignal>

namespace hashdup::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM выставляют g_interrupted; хост сам завершает конвейер
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace hashdup::infra
