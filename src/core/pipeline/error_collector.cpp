#include "error_collector.hpp"
#include <utility>

namespace hashdup::core {

void ErrorCollector::record(std::string_view path, std::string_view name, std::string_view message) {
    errors_.push_back(ProcessingError{
        .path = std::string(path),
        .name = std::string(name),
        .error = std::string(message)
    });
}

auto ErrorCollector::take() -> std::vector<ProcessingError> {
    return std::exchange(errors_, {});
}

} // namespace hashdup::core
