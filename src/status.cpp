#include "status.hpp"

namespace wordclip {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Validation: return "ValidationError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::DimensionMismatch: return "DimensionMismatch";
        case ErrorCode::CorruptArtifact: return "CorruptArtifact";
        case ErrorCode::ExternalTool: return "ExternalToolError";
        case ErrorCode::Io: return "IoError";
    }
    return "Unknown";
}

std::string describe(const Status& status) {
    if (status.ok()) return "Ok";
    return std::string(to_string(status.code)) + ": " + status.message;
}

} // namespace wordclip
