#include "message_codec.hpp"
#include <fmt/core.h>
#include <yaml-cpp/binary.h>

namespace hashdup::core::codec {

using infra::ErrorCode;
using infra::make_error;

namespace {

auto encode_file(const HashedFile& file) -> YAML::Node {
    YAML::Node node;
    node["path"] = file.path;
    node["hash"] = file.hash;
    node["name"] = file.name;
    node["size"] = file.size;
    node["mimeType"] = file.mime_type;
    return node;
}

auto decode_file(const YAML::Node& node) -> HashedFile {
    return HashedFile{
        .path = node["path"].as<std::string>(),
        .name = node["name"].as<std::string>(),
        .size = node["size"].as<std::uint64_t>(),
        .mime_type = node["mimeType"].as<std::string>(""),
        .hash = node["hash"].as<std::string>()
    };
}

struct Encoder {
    auto operator()(const ProgressMessage& m) const -> YAML::Node {
        YAML::Node node;
        node["type"] = "progress";
        node["index"] = m.index;
        node["total"] = m.total;
        node["fileName"] = m.file_name;
        return node;
    }

    auto operator()(const ErrorsMessage& m) const -> YAML::Node {
        YAML::Node node;
        node["type"] = "errors";
        node["errors"] = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& err : m.errors) {
            YAML::Node item;
            item["path"] = err.path;
            item["name"] = err.name;
            item["error"] = err.error;
            node["errors"].push_back(item);
        }
        return node;
    }

    auto operator()(const CompletedMessage& m) const -> YAML::Node {
        YAML::Node node;
        node["type"] = "completed";
        node["groups"] = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& group : m.groups) {
            YAML::Node item;
            item["id"] = group.id;
            item["hash"] = group.hash;
            item["size"] = group.size;
            item["files"] = YAML::Node(YAML::NodeType::Sequence);
            for (const auto& file : group.files) {
                item["files"].push_back(encode_file(file));
            }
            node["groups"].push_back(item);
        }
        return node;
    }

    auto operator()(const FailedMessage& m) const -> YAML::Node {
        YAML::Node node;
        node["type"] = "error";
        node["error"] = m.error;
        return node;
    }
};

auto emit(const YAML::Node& node) -> std::string {
    YAML::Emitter out;
    out << YAML::BeginDoc << node << YAML::Newline;
    return out.c_str();
}

auto parse(std::string_view text) -> infra::Result<YAML::Node> {
    try {
        return YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::MalformedRequest,
                                          fmt::format("Cannot parse message: {}", e.what())));
    }
}

} // namespace

auto encode(const OutboundMessage& message) -> YAML::Node {
    return std::visit(Encoder{}, message);
}

auto encode(const ProcessFilesRequest& request) -> YAML::Node {
    YAML::Node node;
    node["type"] = request.type;
    if (!request.files) {
        return node;
    }

    node["files"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& file : *request.files) {
        YAML::Node item;
        item["path"] = file.path;
        item["name"] = file.name;
        item["size"] = file.size;
        item["mimeType"] = file.mime_type;
        if (file.content) {
            item["content"] = YAML::EncodeBase64(file.content->data(), file.content->size());
        } else {
            item["content"] = YAML::Node(YAML::NodeType::Null);
            item["contentError"] = file.content_error;
        }
        node["files"].push_back(item);
    }
    return node;
}

auto to_yaml(const OutboundMessage& message) -> std::string {
    return emit(encode(message));
}

auto to_yaml(const ProcessFilesRequest& request) -> std::string {
    return emit(encode(request));
}

auto decode_request(const YAML::Node& node) -> infra::Result<ProcessFilesRequest> {
    if (!node.IsMap()) {
        return std::unexpected(make_error(ErrorCode::MalformedRequest, "Message is not a mapping"));
    }

    try {
        ProcessFilesRequest request;
        request.type = node["type"].as<std::string>("");

        const auto files = node["files"];
        if (!files || files.IsNull()) {
            return request; // files отсутствует
        }
        if (!files.IsSequence()) {
            return std::unexpected(make_error(ErrorCode::MalformedRequest, "'files' must be a sequence"));
        }

        request.files.emplace();
        request.files->reserve(files.size());
        for (const auto& item : files) {
            CandidateFile file;
            file.path = item["path"].as<std::string>();
            file.name = item["name"].as<std::string>(file.path);
            file.size = item["size"].as<std::uint64_t>(0);
            file.mime_type = item["mimeType"].as<std::string>("");

            const auto content = item["content"];
            if (content && !content.IsNull()) {
                const auto& encoded = content.Scalar();
                auto data = YAML::DecodeBase64(encoded);
                if (data.empty() && !encoded.empty()) {
                    return std::unexpected(make_error(ErrorCode::MalformedRequest,
                        fmt::format("Invalid base64 content for {}", file.path)));
                }
                file.content = infra::Bytes(data.begin(), data.end());
            } else {
                file.content_error = item["contentError"].as<std::string>("content is not available");
            }
            request.files->push_back(std::move(file));
        }
        return request;
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::MalformedRequest,
                                          fmt::format("Malformed request: {}", e.what())));
    }
}

auto decode_request(std::string_view text) -> infra::Result<ProcessFilesRequest> {
    auto node = parse(text);
    if (!node) {
        return std::unexpected(std::move(node.error()));
    }
    return decode_request(*node);
}

auto decode_message(const YAML::Node& node) -> infra::Result<OutboundMessage> {
    try {
        const auto type = node["type"].as<std::string>("");

        if (type == "progress") {
            return ProgressMessage{
                .index = node["index"].as<std::uint64_t>(),
                .total = node["total"].as<std::uint64_t>(),
                .file_name = node["fileName"].as<std::string>("")
            };
        }
        if (type == "errors") {
            ErrorsMessage message;
            for (const auto& item : node["errors"]) {
                message.errors.push_back(ProcessingError{
                    .path = item["path"].as<std::string>(),
                    .name = item["name"].as<std::string>(""),
                    .error = item["error"].as<std::string>("")
                });
            }
            return message;
        }
        if (type == "completed") {
            CompletedMessage message;
            for (const auto& item : node["groups"]) {
                DuplicateGroup group{
                    .id = item["id"].as<std::string>(),
                    .hash = item["hash"].as<std::string>(),
                    .size = item["size"].as<std::uint64_t>(0),
                    .files = {}
                };
                for (const auto& file : item["files"]) {
                    group.files.push_back(decode_file(file));
                }
                message.groups.push_back(std::move(group));
            }
            return message;
        }
        if (type == "error") {
            return FailedMessage{.error = node["error"].as<std::string>("")};
        }

        return std::unexpected(make_error(ErrorCode::MalformedRequest,
                                          fmt::format("Unknown message type: '{}'", type)));
    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::MalformedRequest,
                                          fmt::format("Malformed message: {}", e.what())));
    }
}

auto decode_message(std::string_view text) -> infra::Result<OutboundMessage> {
    auto node = parse(text);
    if (!node) {
        return std::unexpected(std::move(node.error()));
    }
    return decode_message(*node);
}

} // namespace hashdup::core::codec
