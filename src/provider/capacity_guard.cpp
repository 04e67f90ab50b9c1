#include "spendguard/provider/capacity_guard.hpp"

#include <utility>

namespace spendguard::provider {

CapacityGuard::CapacityGuard(BudgetConfig config)
    : config_(std::move(config))
{}

std::optional<ContextLengthError> CapacityGuard::context_figures(const ProviderException& e) {
    if (e.context().has_value()) return e.context();
    return parse_context_length_error(e.what());
}

InferenceResult CapacityGuard::stream(InferenceClient& client, const InferenceRequest& request,
                                      const TokenCallback& on_token) {
    State state = State::Normal;
    InferenceRequest attempt = request;

    while (true) {
        try {
            return client.stream_completion(attempt, on_token);
        } catch (const ProviderException& e) {
            if (state == State::Retrying) throw;

            const auto figures = context_figures(e);
            if (!figures.has_value()) throw;

            const std::int64_t corrected = figures->max_context - figures->text_input;
            if (corrected < config_.minimum_output_tokens) {
                emit_event(EventType::CapacityTooLow,
                           "Model " + request.model + " leaves " + std::to_string(corrected) +
                           " output tokens, below the minimum",
                           corrected);
                throw ContextCapacityTooLowException(figures->max_context, figures->text_input, corrected);
            }

            emit_event(EventType::CapacityRetry,
                       "Retrying " + request.model + " with max_tokens " + std::to_string(corrected),
                       corrected);
            attempt.max_tokens = corrected;
            state = State::Retrying;
        }
    }
}

void CapacityGuard::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void CapacityGuard::emit_event(EventType type, const std::string& message, std::int64_t tokens) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.tokens = tokens;

    monitor->on_event(event);
}

} // namespace spendguard::provider
