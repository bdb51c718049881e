#include <gtest/gtest.h>

#include <stop_token>
#include "core/pipeline/chunk_scheduler.hpp"
#include "test_support.hpp"

using hashdup::core::CandidateFile;
using hashdup::core::ChunkScheduler;
using hashdup::core::ProgressMessage;
using hashdup::core::ProgressReporter;
using hashdup::infra::ErrorCode;
using hashdup::testing::RecordingSink;

TEST(ChunkSchedulerTest, ZeroChunkSizeFallsBackToOne)
{
    ChunkScheduler scheduler(0);
    EXPECT_EQ(scheduler.chunk_size(), 1u);
}

TEST(ChunkSchedulerTest, ChunkCountRoundsUp)
{
    ChunkScheduler scheduler(50);
    EXPECT_EQ(scheduler.chunk_count(0), 0u);
    EXPECT_EQ(scheduler.chunk_count(50), 1u);
    EXPECT_EQ(scheduler.chunk_count(51), 2u);
    EXPECT_EQ(scheduler.chunk_count(100), 2u);
}

TEST(ChunkSchedulerTest, VisitsFilesInOrderWithProgressFirst)
{
    auto files = hashdup::testing::alternating(7);
    RecordingSink sink;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.begin(files.size()).has_value());

    std::vector<std::string> visited;
    std::vector<std::size_t> progress_seen_at_visit;
    ChunkScheduler scheduler(3, [] {});
    auto res = scheduler.run(files, reporter, [&](CandidateFile& file) {
        visited.push_back(file.name);
        progress_seen_at_visit.push_back(sink.messages.size());
    });
    ASSERT_TRUE(res.has_value());

    ASSERT_EQ(visited.size(), 7u);
    for (std::size_t i = 0; i < visited.size(); ++i) {
        EXPECT_EQ(visited[i], files[i].name);
        // progress для файла i уже отправлен к моменту обработки
        EXPECT_EQ(progress_seen_at_visit[i], i + 1);
    }

    auto progress = sink.all<ProgressMessage>();
    ASSERT_EQ(progress.size(), 7u);
    for (std::size_t i = 0; i < progress.size(); ++i) {
        EXPECT_EQ(progress[i].index, i + 1);
        EXPECT_EQ(progress[i].total, 7u);
    }
}

TEST(ChunkSchedulerTest, YieldsAfterEverySlice)
{
    auto files = hashdup::testing::alternating(100);
    RecordingSink sink;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.begin(files.size()).has_value());

    std::vector<std::size_t> processed_at_yield;
    std::size_t processed = 0;
    ChunkScheduler scheduler(50, [&] { processed_at_yield.push_back(processed); });
    ASSERT_TRUE(scheduler.run(files, reporter, [&](CandidateFile&) { ++processed; }).has_value());

    EXPECT_EQ(processed_at_yield, (std::vector<std::size_t>{50, 100}));
}

TEST(ChunkSchedulerTest, StopRequestCancelsAtNextYield)
{
    auto files = hashdup::testing::alternating(10);
    RecordingSink sink;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.begin(files.size()).has_value());

    std::stop_source source;
    std::size_t processed = 0;
    ChunkScheduler scheduler(4, [&] { source.request_stop(); });
    auto res = scheduler.run(files, reporter, [&](CandidateFile&) { ++processed; }, source.get_token());

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(processed, 4u);
    EXPECT_EQ(sink.messages.size(), 4u);
}

TEST(ChunkSchedulerTest, StopRequestedBeforeRunProcessesNothing)
{
    auto files = hashdup::testing::alternating(3);
    RecordingSink sink;
    ProgressReporter reporter(sink);
    ASSERT_TRUE(reporter.begin(files.size()).has_value());

    std::stop_source source;
    source.request_stop();
    ChunkScheduler scheduler;
    auto res = scheduler.run(files, reporter, [](CandidateFile&) { FAIL(); }, source.get_token());

    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(sink.messages.empty());
}
