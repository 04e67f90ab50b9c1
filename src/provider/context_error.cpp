#include "spendguard/provider/context_error.hpp"

#include <regex>
#include <stdexcept>

namespace spendguard::provider {

namespace {

const std::regex& context_length_pattern() {
    static const std::regex pattern(
        R"(maximum context length is (\d+) tokens\.\s*However, you requested about \d+ tokens \((\d+) of text input,(?: \d+ of \w+ input,)* (\d+) in the output\))");
    return pattern;
}

} // anonymous namespace

std::optional<ContextLengthError> parse_context_length_error(const std::string& message) {
    std::smatch match;
    if (!std::regex_search(message, match, context_length_pattern())) {
        return std::nullopt;
    }

    try {
        ContextLengthError error;
        error.max_context = std::stoll(match[1].str());
        error.text_input = std::stoll(match[2].str());
        error.requested_output = std::stoll(match[3].str());
        return error;
    } catch (const std::out_of_range&) {
        // Figures too large for int64 cannot describe a real context window
        return std::nullopt;
    }
}

} // namespace spendguard::provider
