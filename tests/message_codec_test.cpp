#include <gtest/gtest.h>

#include <variant>
#include "core/pipeline/message_codec.hpp"
#include "test_support.hpp"

namespace codec = hashdup::core::codec;
using hashdup::core::CompletedMessage;
using hashdup::core::DuplicateGroup;
using hashdup::core::ErrorsMessage;
using hashdup::core::FailedMessage;
using hashdup::core::HashedFile;
using hashdup::core::ProgressMessage;
using hashdup::infra::ErrorCode;
using hashdup::testing::bytes;
using hashdup::testing::candidate;
using hashdup::testing::request;
using hashdup::testing::unreadable;

TEST(MessageCodecTest, ProgressUsesWireFieldNames)
{
    auto node = codec::encode(ProgressMessage{.index = 3, .total = 10, .file_name = "c.jpg"});
    EXPECT_EQ(node["type"].as<std::string>(), "progress");
    EXPECT_EQ(node["index"].as<int>(), 3);
    EXPECT_EQ(node["total"].as<int>(), 10);
    EXPECT_EQ(node["fileName"].as<std::string>(), "c.jpg");
}

TEST(MessageCodecTest, CompletedSurvivesYamlText)
{
    HashedFile a{.path = "p/a.jpg", .name = "a.jpg", .size = 3, .mime_type = "image/jpeg", .hash = "abc"};
    HashedFile b{.path = "p/b.jpg", .name = "b.jpg", .size = 3, .mime_type = "image/jpeg", .hash = "abc"};
    CompletedMessage original{.groups = {DuplicateGroup{.id = "group-0", .hash = "abc", .size = 2, .files = {a, b}}}};

    auto text = codec::to_yaml(original);
    EXPECT_EQ(text.rfind("---", 0), 0u);
    EXPECT_NE(text.find("mimeType: image/jpeg"), std::string::npos);

    auto decoded = codec::decode_message(text);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    const auto& groups = std::get<CompletedMessage>(*decoded).groups;
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].id, "group-0");
    EXPECT_EQ(groups[0].files, (std::vector<HashedFile>{a, b}));
}

TEST(MessageCodecTest, ErrorsAndFailureDecode)
{
    auto errors = codec::decode_message(
        "type: errors\nerrors:\n  - {path: p/x.png, name: x.png, error: 'Failed to hash file: io'}\n");
    ASSERT_TRUE(errors.has_value());
    const auto& list = std::get<ErrorsMessage>(*errors).errors;
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].name, "x.png");
    EXPECT_EQ(list[0].error, "Failed to hash file: io");

    auto failed = codec::decode_message("type: error\nerror: boom\n");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(std::get<FailedMessage>(*failed).error, "boom");
}

TEST(MessageCodecTest, UnknownMessageTypeIsRejected)
{
    auto res = codec::decode_message("type: paused\n");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::MalformedRequest);
}

TEST(MessageCodecTest, RequestContentIsBase64)
{
    auto text = codec::to_yaml(request({candidate("a.jpg", "ABC"), unreadable("b.png", "io error")}));
    EXPECT_NE(text.find("QUJD"), std::string::npos);

    auto decoded = codec::decode_request(text);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->type, "processFiles");
    ASSERT_TRUE(decoded->files.has_value());
    ASSERT_EQ(decoded->files->size(), 2u);

    const auto& ok = (*decoded->files)[0];
    EXPECT_EQ(ok.path, "photos/a.jpg");
    EXPECT_EQ(ok.mime_type, "image/jpeg");
    ASSERT_TRUE(ok.content.has_value());
    EXPECT_EQ(*ok.content, bytes("ABC"));

    const auto& broken = (*decoded->files)[1];
    EXPECT_FALSE(broken.content.has_value());
    EXPECT_EQ(broken.content_error, "io error");
}

TEST(MessageCodecTest, MissingFilesDecodesAsAbsent)
{
    auto decoded = codec::decode_request("type: processFiles\n");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->files.has_value());
}

TEST(MessageCodecTest, MalformedRequestsAreRejected)
{
    EXPECT_EQ(codec::decode_request("- just\n- a list\n").error().code, ErrorCode::MalformedRequest);
    EXPECT_EQ(codec::decode_request("type: processFiles\nfiles: 42\n").error().code, ErrorCode::MalformedRequest);
    EXPECT_EQ(codec::decode_request("type: [unclosed\n").error().code, ErrorCode::MalformedRequest);
}
