#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <spdlog/logger.h>
#include "../pipeline/messages.hpp"
#include "../pipeline/orchestrator.hpp"
#include "../../infra/channel/channel.hpp"
#include "../../infra/error_handler/error.hpp"

namespace hashdup::core {

/// Изолированный контекст исполнения конвейера.
///
/// Свой поток с циклом обработки входящих запросов; общение с хостом только
/// через два канала, в них передаются владеющие значения. terminate() прерывает
/// прогон без уведомлений: после возврата хост больше ничего не получит.
class PipelineWorker {
public:
    using Body = std::function<void(std::stop_token)>;
    using Launcher = std::function<std::jthread(Body)>;

    struct Options {
        OrchestratorOptions orchestrator{};
        std::shared_ptr<spdlog::logger> logger;
        Launcher launcher; // пусто = std::jthread
    };

    PipelineWorker();
    explicit PipelineWorker(Options options);
    ~PipelineWorker();

    PipelineWorker(const PipelineWorker&) = delete;
    PipelineWorker& operator=(const PipelineWorker&) = delete;

    // RunInProgress, если предыдущий прогон ещё не завершён
    [[nodiscard]] auto post(ProcessFilesRequest request) -> infra::VoidResult;

    // nullopt после terminate()
    [[nodiscard]] auto receive() -> std::optional<OutboundMessage>;
    [[nodiscard]] auto receive_for(std::chrono::milliseconds timeout) -> std::optional<OutboundMessage>;

    void terminate();

    [[nodiscard]] auto is_available() const -> bool { return !launch_error_.has_value(); }
    [[nodiscard]] auto is_busy() const -> bool { return busy_.load(); }
    [[nodiscard]] auto is_terminated() const -> bool { return terminated_.load(); }

private:
    class ChannelSink;

    void loop_(std::stop_token st);

    Options options_;
    std::shared_ptr<spdlog::logger> logger_;
    infra::Channel<ProcessFilesRequest> inbox_;
    infra::Channel<OutboundMessage> outbox_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> terminated_{false};
    std::optional<infra::Error> launch_error_;
    std::jthread thread_;
};

} // namespace hashdup::core
