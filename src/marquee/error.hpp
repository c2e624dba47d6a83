#pragma once

#include <string>
#include <utility>

namespace Marquee {

/**
 * Error taxonomy shared by the catalog and resolver modules
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    DuplicateSource,
    UnknownSource,
    UnknownEntry,
    SourceFetch,
    SourceParse,
    AggregationFailed,
    PluginChecksum,
    PluginLoad,
    NoResolverAvailable,
    ResolutionExhausted,
    Cancelled,
};

const char* error_code_name(ErrorCode code);

/**
 * Error value passed through callbacks and status returns.
 * A default-constructed Error means success.
 */
struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool ok() const { return code == ErrorCode::None; }
    explicit operator bool() const { return code != ErrorCode::None; }

    // "SourceFetch: HTTP error: 404"
    std::string to_string() const;
};

} // namespace Marquee
