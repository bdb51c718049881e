#include "reporter.hpp"
#include <fmt/core.h>
#include <utility>

namespace hashdup::core {

using infra::ErrorCode;
using infra::make_error;

ProgressReporter::ProgressReporter(MessageSink& sink)
    : sink_(sink) {}

auto ProgressReporter::emit_(OutboundMessage message) -> infra::VoidResult {
    if (detached_) {
        return std::unexpected(make_error(ErrorCode::Cancelled, "Message sink is detached"));
    }
    if (!sink_.emit(std::move(message))) {
        detached_ = true;
        return std::unexpected(make_error(ErrorCode::Cancelled, "Message sink is closed"));
    }
    ++emitted_;
    return {};
}

auto ProgressReporter::begin(std::uint64_t total) -> infra::VoidResult {
    if (state_ != RunState::Idle) {
        return std::unexpected(make_error(ErrorCode::ProtocolViolation,
            fmt::format("Cannot start a run in state '{}'", to_string(state_))));
    }
    state_ = RunState::Processing;
    total_ = total;
    next_index_ = 1;
    return {};
}

auto ProgressReporter::progress(std::uint64_t index, std::string_view file_name) -> infra::VoidResult {
    if (state_ != RunState::Processing) {
        return std::unexpected(make_error(ErrorCode::ProtocolViolation,
            fmt::format("Progress is not allowed in state '{}'", to_string(state_))));
    }
    if (index != next_index_ || index > total_) {
        return std::unexpected(make_error(ErrorCode::ProtocolViolation,
            fmt::format("Out of order progress index {} (expected {} of {})", index, next_index_, total_)));
    }

    auto res = emit_(ProgressMessage{
        .index = index,
        .total = total_,
        .file_name = std::string(file_name)
    });
    if (!res) return res;

    ++next_index_;
    return {};
}

auto ProgressReporter::complete(std::vector<DuplicateGroup> groups,
                                std::vector<ProcessingError> errors) -> infra::VoidResult
{
    if (state_ == RunState::Idle) {
        if (!groups.empty() || !errors.empty()) {
            return std::unexpected(make_error(ErrorCode::ProtocolViolation,
                "Only an empty run may complete without processing"));
        }
    } else if (state_ != RunState::Processing) {
        return std::unexpected(make_error(ErrorCode::ProtocolViolation,
            fmt::format("Cannot complete a run in state '{}'", to_string(state_))));
    } else if (next_index_ != total_ + 1) {
        return std::unexpected(make_error(ErrorCode::ProtocolViolation,
            fmt::format("Run completed after {} of {} progress events", next_index_ - 1, total_)));
    }

    if (!errors.empty()) {
        auto res = emit_(ErrorsMessage{.errors = std::move(errors)});
        if (!res) return res;
    }

    auto res = emit_(CompletedMessage{.groups = std::move(groups)});
    if (!res) return res;

    state_ = RunState::Done;
    return {};
}

auto ProgressReporter::fail(std::string_view message) -> infra::VoidResult {
    if (is_terminal(state_)) {
        return std::unexpected(make_error(ErrorCode::ProtocolViolation,
            fmt::format("Cannot fail a run in state '{}'", to_string(state_))));
    }

    auto res = emit_(FailedMessage{.error = std::string(message)});
    if (!res) return res;

    state_ = RunState::Errored;
    return {};
}

} // namespace hashdup::core
