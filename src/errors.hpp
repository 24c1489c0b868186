#pragma once
#include <string>
#include <variant>
#include <stdexcept>

namespace spychat {

enum class ErrorKind {
    not_found,             // unknown conversation, persona or mission
    upstream_unavailable,  // LLM or backend unreachable / timed out
    upstream_error,        // LLM or backend answered with a failure
    malformed_history,     // stays inside HistoryCodec
    tool_bound_exceeded,   // too many tool calls in one turn
    invalid_request        // malformed inbound envelope
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::not_found:            return "not_found";
    case ErrorKind::upstream_unavailable: return "upstream_unavailable";
    case ErrorKind::upstream_error:       return "upstream_error";
    case ErrorKind::malformed_history:    return "malformed_history";
    case ErrorKind::tool_bound_exceeded:  return "tool_bound_exceeded";
    case ErrorKind::invalid_request:      return "invalid_request";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;
};

// Either a value or an Error. Used at component boundaries for expected
// failures; exceptions are reserved for faults.
template <typename T>
using Result = std::variant<T, Error>;

template <typename T>
bool is_error(const Result<T>& result) {
    return std::holds_alternative<Error>(result);
}

template <typename T>
const Error& get_error(const Result<T>& result) {
    return std::get<Error>(result);
}

template <typename T>
const T& get_value(const Result<T>& result) {
    return std::get<T>(result);
}

template <typename T>
T& get_value(Result<T>& result) {
    return std::get<T>(result);
}

inline Error not_found(const std::string& what) {
    return Error{ErrorKind::not_found, what};
}

// Thrown by LLM clients. Caught at the ToolCallLoop boundary and turned into
// response text.
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace spychat
