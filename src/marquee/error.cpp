#include "error.hpp"

namespace Marquee {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::DuplicateSource: return "DuplicateSource";
        case ErrorCode::UnknownSource: return "UnknownSource";
        case ErrorCode::UnknownEntry: return "UnknownEntry";
        case ErrorCode::SourceFetch: return "SourceFetch";
        case ErrorCode::SourceParse: return "SourceParse";
        case ErrorCode::AggregationFailed: return "AggregationFailed";
        case ErrorCode::PluginChecksum: return "PluginChecksum";
        case ErrorCode::PluginLoad: return "PluginLoad";
        case ErrorCode::NoResolverAvailable: return "NoResolverAvailable";
        case ErrorCode::ResolutionExhausted: return "ResolutionExhausted";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    if (ok()) return "ok";
    if (message.empty()) return error_code_name(code);
    return std::string(error_code_name(code)) + ": " + message;
}

} // namespace Marquee
