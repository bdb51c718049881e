#include <gtest/gtest.h>

#include "core/pipeline/reporter.hpp"
#include "test_support.hpp"

using hashdup::core::CompletedMessage;
using hashdup::core::ErrorsMessage;
using hashdup::core::FailedMessage;
using hashdup::core::ProgressMessage;
using hashdup::core::ProgressReporter;
using hashdup::core::RunState;
using hashdup::infra::ErrorCode;
using hashdup::testing::RecordingSink;

TEST(ProgressReporterTest, EmptyRunCompletesFromIdle)
{
    RecordingSink sink;
    ProgressReporter reporter(sink);

    ASSERT_TRUE(reporter.complete({}, {}).has_value());
    EXPECT_EQ(reporter.state(), RunState::Done);
    EXPECT_EQ(sink.types(), (std::vector<std::string>{"completed"}));
}

TEST(ProgressReporterTest, ProgressThenCompleted)
{
    RecordingSink sink;
    ProgressReporter reporter(sink);

    ASSERT_TRUE(reporter.begin(2).has_value());
    EXPECT_EQ(reporter.state(), RunState::Processing);
    ASSERT_TRUE(reporter.progress(1, "a.jpg").has_value());
    ASSERT_TRUE(reporter.progress(2, "b.jpg").has_value());
    ASSERT_TRUE(reporter.complete({}, {}).has_value());

    EXPECT_EQ(sink.types(), (std::vector<std::string>{"progress", "progress", "completed"}));
    auto progress = sink.all<ProgressMessage>();
    EXPECT_EQ(progress[1].index, 2u);
    EXPECT_EQ(progress[1].total, 2u);
    EXPECT_EQ(progress[1].file_name, "b.jpg");
}

TEST(ProgressReporterTest, ErrorsPrecedeCompleted)
{
    RecordingSink sink;
    ProgressReporter reporter(sink);

    ASSERT_TRUE(reporter.begin(1).has_value());
    ASSERT_TRUE(reporter.progress(1, "a.jpg").has_value());
    ASSERT_TRUE(reporter.complete({}, {{"p/a.jpg", "a.jpg", "boom"}}).has_value());

    EXPECT_EQ(sink.types(), (std::vector<std::string>{"progress", "errors", "completed"}));
    EXPECT_EQ(sink.all<ErrorsMessage>()[0].errors.size(), 1u);
}

TEST(ProgressReporterTest, RejectsOutOfOrderProgress)
{
    RecordingSink sink;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.begin(3).has_value());

    auto skipped = reporter.progress(2, "b");
    ASSERT_FALSE(skipped.has_value());
    EXPECT_EQ(skipped.error().code, ErrorCode::ProtocolViolation);

    ASSERT_TRUE(reporter.progress(1, "a").has_value());
    EXPECT_FALSE(reporter.progress(1, "a").has_value());
    EXPECT_EQ(sink.messages.size(), 1u);
}

TEST(ProgressReporterTest, CannotCompleteBeforeAllProgress)
{
    RecordingSink sink;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.begin(2).has_value());
    ASSERT_TRUE(reporter.progress(1, "a").has_value());

    auto early = reporter.complete({}, {});
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().code, ErrorCode::ProtocolViolation);
    EXPECT_EQ(reporter.state(), RunState::Processing);
}

TEST(ProgressReporterTest, NothingAfterTerminal)
{
    RecordingSink sink;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.fail("context lost").has_value());
    EXPECT_EQ(reporter.state(), RunState::Errored);

    EXPECT_FALSE(reporter.fail("again").has_value());
    EXPECT_FALSE(reporter.complete({}, {}).has_value());
    EXPECT_FALSE(reporter.begin(1).has_value());

    ASSERT_EQ(sink.messages.size(), 1u);
    EXPECT_EQ(sink.all<FailedMessage>()[0].error, "context lost");
}

TEST(ProgressReporterTest, ClosedSinkDetachesReporter)
{
    RecordingSink sink;
    sink.accept = false;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.begin(1).has_value());

    auto res = reporter.progress(1, "a");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(reporter.detached());
    EXPECT_EQ(reporter.emitted(), 0u);
}
