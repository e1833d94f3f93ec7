#pragma once
#include <string>
#include <utility>

namespace MiniPainter {

/**
 * @brief Failure categories of the load/segment pipeline.
 *
 * Every failure aborts before the paint state of the new model is built;
 * the previously loaded model stays interactive.
 */
enum class ErrorKind {
    None,
    FormatError,         // unsupported or corrupt input mesh
    TruncatedError,      // declared triangle count needs more bytes than present
    BackendUnavailable,  // transport failure talking to the oracle
    SegmentationError,   // oracle reported a failure; message shown verbatim
    ProtocolError        // oracle answered with a malformed document
};

const char* errorKindName(ErrorKind kind);

/**
 * @brief Whether re-issuing the same upload may succeed.
 */
bool isRetryable(ErrorKind kind);

struct PipelineError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    PipelineError() = default;
    PipelineError(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool isError() const { return kind != ErrorKind::None; }

    // "<KindName>: <message>", or empty when there is no error
    std::string describe() const;
};

} // namespace MiniPainter
