#pragma once

#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>
#include "messages.hpp"
#include "../../infra/error_handler/error.hpp"

namespace hashdup::core::codec {

// Поля на проводе: type, files[path, name, size, mimeType, content(base64)],
// index, total, fileName, errors[path, name, error], groups[id, hash, size, files].

[[nodiscard]] auto encode(const OutboundMessage& message) -> YAML::Node;
[[nodiscard]] auto encode(const ProcessFilesRequest& request) -> YAML::Node;

// Один YAML-документ на сообщение
[[nodiscard]] auto to_yaml(const OutboundMessage& message) -> std::string;
[[nodiscard]] auto to_yaml(const ProcessFilesRequest& request) -> std::string;

/// Отсутствующее поле files не считается ошибкой декодирования:
/// его отклоняет Orchestrator как MalformedRequest.
[[nodiscard]] auto decode_request(const YAML::Node& node) -> infra::Result<ProcessFilesRequest>;
[[nodiscard]] auto decode_request(std::string_view text) -> infra::Result<ProcessFilesRequest>;

[[nodiscard]] auto decode_message(const YAML::Node& node) -> infra::Result<OutboundMessage>;
[[nodiscard]] auto decode_message(std::string_view text) -> infra::Result<OutboundMessage>;

} // namespace hashdup::core::codec
