#include "error.hpp"

namespace molly {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FileNotFound:     return "FileNotFound";
        case ErrorKind::BadMagic:         return "BadMagic";
        case ErrorKind::TruncatedInput:   return "TruncatedInput";
        case ErrorKind::CorruptFrame:     return "CorruptFrame";
        case ErrorKind::EmptyTrajectory:  return "EmptyTrajectory";
        case ErrorKind::EndOfTrajectory:  return "EndOfTrajectory";
        case ErrorKind::IndexOutOfRange:  return "IndexOutOfRange";
        case ErrorKind::ShapeMismatch:    return "ShapeMismatch";
        case ErrorKind::InvalidSelection: return "InvalidSelection";
        case ErrorKind::ReaderClosed:     return "ReaderClosed";
    }
    return "Unknown";
}

static std::string format_message(ErrorKind kind, const std::string& detail, std::size_t frame) {
    std::string msg = std::string(error_kind_name(kind)) + ": " + detail;
    if (frame != XtcError::npos) {
        msg += " (frame " + std::to_string(frame) + ")";
    }
    return msg;
}

XtcError::XtcError(ErrorKind kind, const std::string& message, std::size_t frame)
    : std::runtime_error(format_message(kind, message, frame)),
      kind_(kind), frame_(frame), detail_(message) {}

XtcError XtcError::with_frame(std::size_t frame) const {
    XtcError e(kind_, detail_, frame);
    e.rows_valid_ = rows_valid_;
    return e;
}

XtcError XtcError::with_rows_valid(std::size_t rows) const {
    XtcError e(kind_, detail_, frame_);
    e.rows_valid_ = rows;
    return e;
}

} // namespace molly
