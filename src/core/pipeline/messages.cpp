#include "messages.hpp"

namespace hashdup::core {

namespace {

struct TypeName {
    auto operator()(const ProgressMessage&) const -> std::string_view { return "progress"; }
    auto operator()(const ErrorsMessage&) const -> std::string_view { return "errors"; }
    auto operator()(const CompletedMessage&) const -> std::string_view { return "completed"; }
    auto operator()(const FailedMessage&) const -> std::string_view { return "error"; }
};

} // namespace

auto message_type(const OutboundMessage& message) -> std::string_view {
    return std::visit(TypeName{}, message);
}

} // namespace hashdup::core
