#pragma once

#include <string>

namespace fetchd {

/**
 * @brief Failure categories surfaced by the job engine
 *
 * Input and PartialEntry never reach a worker. Canceled is kept apart from
 * Transfer so a user abort never shows up as a fault.
 */
enum class ErrorKind {
    Input,
    Resolution,
    Transfer,
    Canceled,
    PartialEntry,
    NotFound,
    Superseded,
    Config,
    Internal
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Input: return "input";
        case ErrorKind::Resolution: return "resolution";
        case ErrorKind::Transfer: return "transfer";
        case ErrorKind::Canceled: return "canceled";
        case ErrorKind::PartialEntry: return "partial_entry";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Superseded: return "superseded";
        case ErrorKind::Config: return "config";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    static Error input(std::string msg) { return {ErrorKind::Input, std::move(msg)}; }
    static Error resolution(std::string msg) { return {ErrorKind::Resolution, std::move(msg)}; }
    static Error transfer(std::string msg) { return {ErrorKind::Transfer, std::move(msg)}; }
    static Error canceled() { return {ErrorKind::Canceled, "Canceled by user"}; }
    static Error not_found(std::string msg) { return {ErrorKind::NotFound, std::move(msg)}; }
    static Error superseded(std::string msg) { return {ErrorKind::Superseded, std::move(msg)}; }
    static Error config(std::string msg) { return {ErrorKind::Config, std::move(msg)}; }
    static Error internal(std::string msg) { return {ErrorKind::Internal, std::move(msg)}; }

    bool is(ErrorKind k) const noexcept { return kind == k; }
};

} // namespace fetchd
