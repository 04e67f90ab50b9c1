#pragma once

#include "spendguard/config.hpp"
#include "spendguard/monitor.hpp"
#include "spendguard/provider/inference_client.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace spendguard::provider {

// Retries a context-length rejection once with a corrected max_tokens.
// Normal -> Retrying on the first context-length error; any failure while
// Retrying propagates unchanged. Other error kinds are never retried.
class CapacityGuard {
public:
    enum class State { Normal, Retrying };

    explicit CapacityGuard(BudgetConfig config = BudgetConfig{});

    InferenceResult stream(InferenceClient& client, const InferenceRequest& request,
                           const TokenCallback& on_token);

    // Structured figures if attached, else parsed from the message
    static std::optional<ContextLengthError> context_figures(const ProviderException& e);

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    BudgetConfig config_;
    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    void emit_event(EventType type, const std::string& message, std::int64_t tokens);
};

} // namespace spendguard::provider
