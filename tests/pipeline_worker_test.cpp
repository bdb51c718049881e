#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <variant>
#include "core/worker/pipeline_worker.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using hashdup::core::CompletedMessage;
using hashdup::core::FailedMessage;
using hashdup::core::OrchestratorOptions;
using hashdup::core::OutboundMessage;
using hashdup::core::PipelineWorker;
using hashdup::core::ProgressMessage;
using hashdup::infra::ErrorCode;
using hashdup::testing::alternating;
using hashdup::testing::candidate;
using hashdup::testing::request;

namespace {

// Читает сообщения до терминального
std::vector<OutboundMessage> drain(PipelineWorker& worker) {
    std::vector<OutboundMessage> out;
    while (auto message = worker.receive_for(5s)) {
        const bool last = hashdup::core::is_terminal(*message);
        out.push_back(std::move(*message));
        if (last) break;
    }
    return out;
}

PipelineWorker::Options slow_options(std::size_t chunk_size) {
    return PipelineWorker::Options{
        .orchestrator = OrchestratorOptions{
            .chunk_size = chunk_size,
            .algorithm = hashdup::infra::DigestAlgorithm::Sha256,
            .yield = [] { std::this_thread::sleep_for(20ms); }
        },
        .logger = nullptr,
        .launcher = {}
    };
}

} // namespace

TEST(PipelineWorkerTest, RunsRequestAndReportsGroups)
{
    PipelineWorker worker;
    ASSERT_TRUE(worker.is_available());

    ASSERT_TRUE(worker.post(request({
        candidate("a.jpg", "ABC"),
        candidate("b.jpg", "ABC"),
        candidate("c.jpg", "XYZ"),
    })).has_value());

    auto messages = drain(worker);
    ASSERT_EQ(messages.size(), 4u);
    for (std::size_t i = 0; i < 3; ++i) {
        const auto& progress = std::get<ProgressMessage>(messages[i]);
        EXPECT_EQ(progress.index, i + 1);
        EXPECT_EQ(progress.total, 3u);
    }
    const auto& completed = std::get<CompletedMessage>(messages[3]);
    ASSERT_EQ(completed.groups.size(), 1u);
    EXPECT_EQ(completed.groups[0].files.size(), 2u);
}

TEST(PipelineWorkerTest, TerminateDuringRunSilencesWorker)
{
    PipelineWorker worker(slow_options(1));
    ASSERT_TRUE(worker.post(request(alternating(10))).has_value());

    for (int i = 1; i <= 3; ++i) {
        auto message = worker.receive_for(5s);
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(std::get<ProgressMessage>(*message).index, static_cast<std::uint64_t>(i));
    }

    worker.terminate();
    EXPECT_TRUE(worker.is_terminated());
    EXPECT_FALSE(worker.is_busy());
    EXPECT_FALSE(worker.receive_for(200ms).has_value());
    EXPECT_FALSE(worker.receive().has_value());
}

TEST(PipelineWorkerTest, SecondPostWhileBusyIsRejected)
{
    PipelineWorker worker(slow_options(1));
    ASSERT_TRUE(worker.post(request(alternating(10))).has_value());

    auto second = worker.post(request(alternating(2)));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::RunInProgress);
    worker.terminate();
}

TEST(PipelineWorkerTest, SequentialRunsReuseWorker)
{
    PipelineWorker worker;

    ASSERT_TRUE(worker.post(request(alternating(4))).has_value());
    auto first = drain(worker);
    ASSERT_FALSE(first.empty());
    EXPECT_EQ(std::get<CompletedMessage>(first.back()).groups.size(), 2u);

    ASSERT_TRUE(worker.post(request({})).has_value());
    auto second = drain(worker);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_TRUE(std::get<CompletedMessage>(second[0]).groups.empty());
}

TEST(PipelineWorkerTest, PostAfterTerminateFails)
{
    PipelineWorker worker;
    worker.terminate();
    worker.terminate();

    auto res = worker.post(request({}));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ExecutionContextUnavailable);
}

TEST(PipelineWorkerTest, LaunchFailureYieldsSingleError)
{
    PipelineWorker worker(PipelineWorker::Options{
        .orchestrator = {},
        .logger = nullptr,
        .launcher = [](PipelineWorker::Body) -> std::jthread {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
    });
    EXPECT_FALSE(worker.is_available());

    ASSERT_TRUE(worker.post(request(alternating(5))).has_value());
    auto message = worker.receive_for(1s);
    ASSERT_TRUE(message.has_value());
    const auto& failed = std::get<FailedMessage>(*message);
    EXPECT_NE(failed.error.find("Execution context unavailable"), std::string::npos);
    EXPECT_FALSE(worker.receive_for(100ms).has_value());
}

TEST(PipelineWorkerTest, MalformedRequestReportsError)
{
    PipelineWorker worker;
    hashdup::core::ProcessFilesRequest malformed;
    ASSERT_TRUE(worker.post(std::move(malformed)).has_value());

    auto messages = drain(worker);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<FailedMessage>(messages[0]));
}

TEST(PipelineWorkerTest, ExceptionInRunBecomesSingleError)
{
    PipelineWorker worker(PipelineWorker::Options{
        .orchestrator = OrchestratorOptions{
            .chunk_size = 1,
            .algorithm = hashdup::infra::DigestAlgorithm::Sha256,
            .yield = [] { throw std::runtime_error("scheduler yield failed"); }
        },
        .logger = nullptr,
        .launcher = {}
    });

    ASSERT_TRUE(worker.post(request({candidate("a.jpg", "ABC")})).has_value());
    auto messages = drain(worker);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ProgressMessage>(messages[0]));
    const auto& failed = std::get<FailedMessage>(messages[1]);
    EXPECT_NE(failed.error.find("scheduler yield failed"), std::string::npos);
    EXPECT_FALSE(worker.receive_for(100ms).has_value());

    // Контекст остаётся рабочим после сбоя прогона
    EXPECT_FALSE(worker.is_busy());
    ASSERT_TRUE(worker.post(request({})).has_value());
    auto next = drain(worker);
    ASSERT_EQ(next.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<CompletedMessage>(next[0]));
}
