#pragma once

#include <cstddef>
#include <string_view>
#include <vector>
#include "types.hpp"

namespace hashdup::core {

// Append-only список ошибок по файлам, в порядке появления.
class ErrorCollector {
public:
    void record(std::string_view path, std::string_view name, std::string_view message);

    [[nodiscard]] auto empty() const -> bool { return errors_.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return errors_.size(); }
    [[nodiscard]] auto errors() const -> const std::vector<ProcessingError>& { return errors_; }

    // Забирает накопленные ошибки; коллектор становится пустым
    [[nodiscard]] auto take() -> std::vector<ProcessingError>;

private:
    std::vector<ProcessingError> errors_;
};

} // namespace hashdup::core
