#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace hashdup::infra {

// Односторонний FIFO-канал между потоками.
// После close() новые сообщения отбрасываются, а receive() возвращает nullopt.
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // false, если канал уже закрыт
    bool send(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // Блокирующее ожидание
    [[nodiscard]] auto receive() -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return pop_locked_();
    }

    template<typename Rep, typename Period>
    [[nodiscard]] auto receive_for(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return pop_locked_();
    }

    [[nodiscard]] auto try_receive() -> std::optional<T> {
        std::lock_guard lock(mutex_);
        return pop_locked_();
    }

    // Закрывает канал; discard_pending = true выбрасывает ещё не прочитанные сообщения
    void close(bool discard_pending = false) {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            if (discard_pending) {
                queue_.clear();
            }
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    auto pop_locked_() -> std::optional<T> {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace hashdup::infra
