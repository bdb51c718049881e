#include "pipeline_worker.hpp"
#include <fmt/core.h>
#include <exception>
#include <system_error>
#include <utility>
#include "../../infra/logging/logging.hpp"

namespace hashdup::core {

using infra::ErrorCode;
using infra::make_error;

class PipelineWorker::ChannelSink : public MessageSink {
public:
    ChannelSink(infra::Channel<OutboundMessage>& channel, std::atomic<bool>& busy)
        : channel_(channel), busy_(busy) {}

    bool emit(OutboundMessage message) override {
        // Освобождаем контекст до отправки, чтобы хост мог сразу начать следующий прогон
        if (is_terminal(message)) {
            terminal_sent_ = true;
            busy_.store(false);
        }
        return channel_.send(std::move(message));
    }

    void reset() { terminal_sent_ = false; }
    [[nodiscard]] auto terminal_sent() const -> bool { return terminal_sent_; }

private:
    infra::Channel<OutboundMessage>& channel_;
    std::atomic<bool>& busy_;
    bool terminal_sent_ = false;
};

PipelineWorker::PipelineWorker()
    : PipelineWorker(Options{}) {}

PipelineWorker::PipelineWorker(Options options)
    : options_(std::move(options))
    , logger_(options_.logger ? options_.logger : infra::make_null_logger("hashdup.worker"))
{
    Body body = [this](std::stop_token st) { loop_(st); };

    try {
        if (options_.launcher) {
            thread_ = options_.launcher(std::move(body));
        } else {
            thread_ = std::jthread(std::move(body));
        }
        if (!thread_.joinable()) {
            launch_error_ = make_error(ErrorCode::ExecutionContextUnavailable,
                                       "Execution context unavailable: worker thread was not started");
        }
    } catch (const std::system_error& e) {
        launch_error_ = make_error(ErrorCode::ExecutionContextUnavailable,
                                   fmt::format("Execution context unavailable: {}", e.what()));
    }

    if (launch_error_) {
        logger_->error("{}", launch_error_->message);
    } else {
        logger_->debug("Worker initialized");
    }
}

PipelineWorker::~PipelineWorker() {
    terminate();
}

auto PipelineWorker::post(ProcessFilesRequest request) -> infra::VoidResult {
    if (terminated_.load()) {
        return std::unexpected(make_error(ErrorCode::ExecutionContextUnavailable,
                                          "Worker has been terminated"));
    }

    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        return std::unexpected(make_error(ErrorCode::RunInProgress,
                                          "A run is already in progress on this worker"));
    }

    // Контекст не поднялся: отвечаем одним сообщением error, без progress
    if (launch_error_) {
        busy_.store(false);
        (void)outbox_.send(FailedMessage{.error = launch_error_->message});
        return {};
    }

    logger_->debug("Worker received message: {}", request.type);
    if (!inbox_.send(std::move(request))) {
        busy_.store(false);
        return std::unexpected(make_error(ErrorCode::ExecutionContextUnavailable,
                                          "Worker inbox is closed"));
    }
    return {};
}

auto PipelineWorker::receive() -> std::optional<OutboundMessage> {
    return outbox_.receive();
}

auto PipelineWorker::receive_for(std::chrono::milliseconds timeout) -> std::optional<OutboundMessage> {
    return outbox_.receive_for(timeout);
}

void PipelineWorker::terminate() {
    if (terminated_.exchange(true)) {
        return;
    }
    logger_->debug("Terminating worker...");

    if (thread_.joinable()) {
        thread_.request_stop();
    }
    // Всё, что ещё не прочитано или будет отправлено позже, отбрасывается
    outbox_.close(true);
    inbox_.close(true);

    if (thread_.joinable()) {
        thread_.join();
    }
    busy_.store(false);
}

void PipelineWorker::loop_(std::stop_token st) {
    Orchestrator orchestrator(options_.orchestrator, logger_);
    ChannelSink sink(outbox_, busy_);

    while (!st.stop_requested()) {
        auto request = inbox_.receive();
        if (!request) {
            break; // канал закрыт
        }

        sink.reset();
        try {
            auto state = orchestrator.run(std::move(*request), sink, st);
            logger_->debug("Run finished in state '{}'", to_string(state));
        } catch (const std::exception& e) {
            // Исключение не должно покидать поток: прогон завершается одним error
            logger_->error("Run aborted by exception: {}", e.what());
            // emit терминального сообщения освобождает busy_
            if (!sink.terminal_sent()) {
                (void)sink.emit(FailedMessage{.error = fmt::format("Pipeline failure: {}", e.what())});
            }
        }
    }
}

} // namespace hashdup::core
