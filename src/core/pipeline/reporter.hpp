#pragma once

#include <cstdint>
#include <string_view>
#include <vector>
#include "messages.hpp"
#include "types.hpp"
#include "../../infra/error_handler/error.hpp"

namespace hashdup::core {

/// Конечный автомат одного прогона: idle -> processing -> {done | errored}.
///
/// Гарантирует порядок исходящих сообщений: progress 1..N, затем errors
/// (если есть), затем ровно одно терминальное сообщение. После терминального
/// состояния ничего не отправляется.
class ProgressReporter {
public:
    explicit ProgressReporter(MessageSink& sink);

    [[nodiscard]] auto begin(std::uint64_t total) -> infra::VoidResult;
    [[nodiscard]] auto progress(std::uint64_t index, std::string_view file_name) -> infra::VoidResult;

    // errors -> completed; из idle допустимо только для пустого входа
    [[nodiscard]] auto complete(std::vector<DuplicateGroup> groups,
                                std::vector<ProcessingError> errors) -> infra::VoidResult;

    [[nodiscard]] auto fail(std::string_view message) -> infra::VoidResult;

    [[nodiscard]] auto state() const -> RunState { return state_; }
    [[nodiscard]] auto total() const -> std::uint64_t { return total_; }
    [[nodiscard]] auto emitted() const -> std::uint64_t { return emitted_; }

    // Получатель отказался принимать сообщения (контекст завершён)
    [[nodiscard]] auto detached() const -> bool { return detached_; }

private:
    auto emit_(OutboundMessage message) -> infra::VoidResult;

    MessageSink& sink_;
    RunState state_ = RunState::Idle;
    std::uint64_t total_ = 0;
    std::uint64_t next_index_ = 1;
    std::uint64_t emitted_ = 0;
    bool detached_ = false;
};

} // namespace hashdup::core
