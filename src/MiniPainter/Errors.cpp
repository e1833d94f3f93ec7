#include <MiniPainter/Errors.hpp>

namespace MiniPainter {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "None";
    case ErrorKind::FormatError: return "FormatError";
    case ErrorKind::TruncatedError: return "TruncatedError";
    case ErrorKind::BackendUnavailable: return "BackendUnavailable";
    case ErrorKind::SegmentationError: return "SegmentationError";
    case ErrorKind::ProtocolError: return "ProtocolError";
    }
    return "Unknown";
}

bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::BackendUnavailable || kind == ErrorKind::SegmentationError;
}

std::string PipelineError::describe() const {
    if (!isError()) return std::string();
    if (message.empty()) return errorKindName(kind);
    return std::string(errorKindName(kind)) + ": " + message;
}

} // namespace MiniPainter
