#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace spendguard::provider {

// Figures reported by a provider when input + requested output exceed the context window
struct ContextLengthError {
    std::int64_t max_context{0};
    std::int64_t text_input{0};
    std::int64_t requested_output{0};
};

// Parses "maximum context length is N tokens. However, you requested about T
// tokens (X of text input[, Y of image input][, Z of tool input], W in the output)".
// Other input kinds are skipped. Any prefix and line breaks are tolerated.
// Returns nullopt when the message does not match, including a missing output clause.
std::optional<ContextLengthError> parse_context_length_error(const std::string& message);

} // namespace spendguard::provider
