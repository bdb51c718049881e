#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "types.hpp"

namespace hashdup::core {

inline constexpr std::string_view PROCESS_FILES_TYPE = "processFiles";

// host -> pipeline
struct ProcessFilesRequest {
    std::string type{PROCESS_FILES_TYPE};
    std::optional<std::vector<CandidateFile>> files; // nullopt = поле отсутствует
};

// pipeline -> host
struct ProgressMessage {
    std::uint64_t index = 0; // 1-based
    std::uint64_t total = 0;
    std::string file_name;
};

struct ErrorsMessage {
    std::vector<ProcessingError> errors;
};

struct CompletedMessage {
    std::vector<DuplicateGroup> groups;
};

struct FailedMessage {
    std::string error;
};

using OutboundMessage = std::variant<ProgressMessage, ErrorsMessage, CompletedMessage, FailedMessage>;

/// Имя типа сообщения на проводе: "progress", "errors", "completed", "error".
[[nodiscard]] auto message_type(const OutboundMessage& message) -> std::string_view;

[[nodiscard]] inline auto is_terminal(const OutboundMessage& message) -> bool {
    return std::holds_alternative<CompletedMessage>(message)
        || std::holds_alternative<FailedMessage>(message);
}

/// Получатель исходящих сообщений одного прогона.
class MessageSink {
public:
    virtual ~MessageSink() = default;

    // false: получатель больше не принимает сообщения (контекст завершён)
    virtual bool emit(OutboundMessage message) = 0;
};

} // namespace hashdup::core
