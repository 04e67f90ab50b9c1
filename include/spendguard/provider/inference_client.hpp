#pragma once

#include "spendguard/exceptions.hpp"
#include "spendguard/provider/context_error.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spendguard::provider {

struct ChatMessage {
    std::string role;       // "system", "user", "assistant"
    std::string content;
};

struct InferenceRequest {
    std::string model;
    std::vector<ChatMessage> messages;

    // Unset lets the provider fill the remaining context
    std::optional<std::int64_t> max_tokens;
};

// Final accounting of a completed stream
struct InferenceResult {
    std::string content;
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
    std::int64_t cached_tokens{0};
    std::string generation_id;
};

enum class ProviderErrorKind {
    ContextLength,
    RateLimited,
    Authentication,
    InvalidRequest,
    Upstream,
    Aborted         // caller disconnected or the stream was cut mid-way
};

inline const char* to_string(ProviderErrorKind k) {
    switch (k) {
        case ProviderErrorKind::ContextLength:  return "context_length";
        case ProviderErrorKind::RateLimited:    return "rate_limited";
        case ProviderErrorKind::Authentication: return "authentication";
        case ProviderErrorKind::InvalidRequest: return "invalid_request";
        case ProviderErrorKind::Upstream:       return "upstream";
        case ProviderErrorKind::Aborted:        return "aborted";
    }
    return "unknown";
}

// Raised by inference clients. Context-length rejections may carry the
// structured figures; otherwise they are parsed from the message.
class ProviderException : public SpendGuardException {
public:
    ProviderException(ProviderErrorKind kind, const std::string& message,
                      std::optional<ContextLengthError> context = std::nullopt)
        : SpendGuardException(message)
        , kind_(kind)
        , context_(context) {}

    ProviderErrorKind kind() const noexcept { return kind_; }
    const std::optional<ContextLengthError>& context() const noexcept { return context_; }

private:
    ProviderErrorKind kind_;
    std::optional<ContextLengthError> context_;
};

using TokenCallback = std::function<void(const std::string& token)>;

// Streaming chat completion backend
class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    // Delivers tokens through on_token as they arrive and returns the usage
    // once the stream is complete. Throws ProviderException on failure.
    virtual InferenceResult stream_completion(const InferenceRequest& request,
                                              const TokenCallback& on_token) = 0;
};

} // namespace spendguard::provider
