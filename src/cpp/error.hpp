#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace molly {

/**
 * @brief Categories of failures raised by the reader.
 */
enum class ErrorKind {
    FileNotFound,
    BadMagic,
    TruncatedInput,
    CorruptFrame,
    EmptyTrajectory,
    EndOfTrajectory,   // cursor exhausted, normal termination
    IndexOutOfRange,
    ShapeMismatch,
    InvalidSelection,
    ReaderClosed,      // used after close()
};

const char* error_kind_name(ErrorKind kind);

/**
 * @brief Exception thrown by every molly operation.
 *
 * `frame()` is the frame number the failure belongs to, or `npos` when the
 * failure is not tied to a frame. `rows_valid()` is only meaningful for
 * read_into_array: rows [0, rows_valid) of the output buffers are complete.
 */
class XtcError : public std::runtime_error {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    XtcError(ErrorKind kind, const std::string& message, std::size_t frame = npos);

    ErrorKind kind() const { return kind_; }
    std::size_t frame() const { return frame_; }
    bool has_frame() const { return frame_ != npos; }
    std::size_t rows_valid() const { return rows_valid_; }

    /** @brief Copy of this error with the frame number attached. */
    XtcError with_frame(std::size_t frame) const;
    /** @brief Copy of this error recording how many output rows are valid. */
    XtcError with_rows_valid(std::size_t rows) const;

private:
    ErrorKind kind_;
    std::size_t frame_;
    std::size_t rows_valid_ = 0;
    std::string detail_;
};

} // namespace molly
