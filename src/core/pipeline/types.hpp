#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../../infra/hash/digest_engine.hpp"

namespace hashdup::core {

struct CandidateFile {
    std::string path;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::optional<infra::Bytes> content; // nullopt: хост не смог прочитать файл
    std::string content_error;           // причина, если content отсутствует
};

struct HashedFile {
    std::string path;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::string hash;

    bool operator==(const HashedFile&) const = default;
};

struct ProcessingError {
    std::string path;
    std::string name;
    std::string error;

    bool operator==(const ProcessingError&) const = default;
};

struct DuplicateGroup {
    std::string id;   // "group-0", "group-1", ...
    std::string hash;
    std::uint64_t size = 0;
    std::vector<HashedFile> files; // первый файл считается оригиналом

    bool operator==(const DuplicateGroup&) const = default;
};

struct GroupSummary {
    std::uint64_t group_count = 0;
    std::uint64_t duplicate_file_count = 0; // без первого файла каждой группы
    std::uint64_t wasted_bytes = 0;
};

enum class RunState {
    Idle,
    Processing,
    Done,
    Errored,
};

[[nodiscard]] constexpr auto to_string(RunState state) -> std::string_view {
    switch (state) {
        case RunState::Idle:       return "idle";
        case RunState::Processing: return "processing";
        case RunState::Done:       return "done";
        case RunState::Errored:    return "errored";
    }
    return "idle";
}

[[nodiscard]] constexpr auto is_terminal(RunState state) -> bool {
    return state == RunState::Done || state == RunState::Errored;
}

} // namespace hashdup::core
