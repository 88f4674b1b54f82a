#include "errors.hpp"

#include <fmt/format.h>

namespace prereq {

const char* kind_name(InvalidRequirement::Kind kind) {
    switch (kind) {
        case InvalidRequirement::Kind::MISSING_BOUND:
            return "Missing bound";
        case InvalidRequirement::Kind::INVALID_BOUND:
            return "Invalid bound";
        case InvalidRequirement::Kind::EMPTY_FIELD:
            return "Empty field";
        case InvalidRequirement::Kind::MISSING_FIELD:
            return "Missing field";
        case InvalidRequirement::Kind::WRONG_TYPE:
            return "Wrong type";
        case InvalidRequirement::Kind::UNKNOWN_VARIANT:
            return "Unknown requirement type";
        case InvalidRequirement::Kind::UNKNOWN_KEY:
            return "Unknown key";
        case InvalidRequirement::Kind::NOT_A_SEQUENCE:
            return "Not a sequence";
        case InvalidRequirement::Kind::MALFORMED_JSON:
            return "Malformed JSON";
        case InvalidRequirement::Kind::TOO_DEEP:
            return "Nesting too deep";
    }
    return "Invalid requirement";
}

const char* kind_name(FactProviderError::Kind kind) {
    switch (kind) {
        case FactProviderError::Kind::UNAVAILABLE:
            return "Unavailable";
        case FactProviderError::Kind::QUERY_FAILED:
            return "Query failed";
        case FactProviderError::Kind::MALFORMED_DOCUMENT:
            return "Malformed document";
    }
    return "Fact provider error";
}

// InvalidRequirement のエラーメッセージフォーマット
std::string InvalidRequirement::format_error(Kind kind, const std::string& message,
                                             const std::string& path) {
    if (path.empty()) {
        return fmt::format("[REQUIREMENT] {}: {}", kind_name(kind), message);
    }
    return fmt::format("[REQUIREMENT] {}: {} at {}", kind_name(kind), message, path);
}

// FactProviderError のエラーメッセージフォーマット
std::string FactProviderError::format_error(Kind kind, const std::string& provider,
                                            const std::string& message) {
    return fmt::format("[FACTS] {} ({}): {}", kind_name(kind), provider, message);
}

}  // namespace prereq
