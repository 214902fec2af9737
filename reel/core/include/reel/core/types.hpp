/**
 * @file types.hpp
 * @brief Core type definitions for reel
 *
 * All internal timestamps use int64_t microseconds to prevent
 * floating-point precision loss when mapping frame indices to time.
 */

#pragma once

#include <cstdint>
#include <climits>
#include <cmath>
#include <limits>

namespace reel {

// ============================================================================
// Time Types - ALL timestamps are microseconds (int64_t)
// ============================================================================

/// Timestamp in microseconds since media start
using Timestamp = int64_t;

/// Duration in microseconds
using Duration = int64_t;

/// Time base constant: 1 second = 1,000,000 microseconds
constexpr Timestamp kTimeBaseUs = 1'000'000;

/// Invalid timestamp sentinel
constexpr Timestamp kNoTimestamp = INT64_MIN;

/// Frame index meaning "the last frame of the stream"
constexpr int64_t kLastFrame = std::numeric_limits<int64_t>::max();

/// Rational number (frame rates, time bases)
struct Rational {
    int num = 0;
    int den = 1;

    [[nodiscard]] double toDouble() const {
        return den != 0 ? static_cast<double>(num) / den : 0.0;
    }

    [[nodiscard]] bool isValid() const { return num > 0 && den > 0; }
};

/// Picture size in pixels
struct Size {
    int width = 0;
    int height = 0;
};

/**
 * @brief Start time of a zero-based frame number
 *
 * Frame n starts at n / rate seconds, rounded to the nearest microsecond.
 */
inline Timestamp frameToTimestamp(int64_t frameNumber, Rational rate) {
    if (!rate.isValid()) return 0;
    double seconds = static_cast<double>(frameNumber) * rate.den / rate.num;
    return static_cast<Timestamp>(std::llround(seconds * kTimeBaseUs));
}

/// Zero-based frame number nearest to a timestamp
inline int64_t timestampToFrame(Timestamp time, Rational rate) {
    if (!rate.isValid() || time == kNoTimestamp) return 0;
    double frames = static_cast<double>(time) / kTimeBaseUs * rate.num / rate.den;
    return static_cast<int64_t>(std::llround(frames));
}

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // General errors
    Unknown,
    InvalidArgument,
    NotFound,
    NotSupported,
    OutOfMemory,

    // I/O errors
    FileNotFound,
    FileOpenFailed,
    ReadError,
    WriteError,
    EndOfFile,

    // Codec errors
    CodecNotFound,
    DecoderError,
    InvalidData,

    // Stream errors
    SequenceNotDetected,
    UnsupportedFormat,
    OutOfRange,
    EndOfStream,
    StreamClosed,
};

/// Convert ErrorCode to string
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::OutOfMemory: return "Out of memory";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileOpenFailed: return "File open failed";
        case ErrorCode::ReadError: return "Read error";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::EndOfFile: return "End of file";
        case ErrorCode::CodecNotFound: return "Codec not found";
        case ErrorCode::DecoderError: return "Decoder error";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::SequenceNotDetected: return "No image index found";
        case ErrorCode::UnsupportedFormat: return "Unsupported format";
        case ErrorCode::OutOfRange: return "Frame out of range";
        case ErrorCode::EndOfStream: return "End of stream";
        case ErrorCode::StreamClosed: return "Stream closed";
        default: return "Unknown error code";
    }
}

/// True for the codes produced by failing to open, read or decode a file
inline bool isIoError(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileOpenFailed:
        case ErrorCode::ReadError:
        case ErrorCode::EndOfFile:
        case ErrorCode::CodecNotFound:
        case ErrorCode::DecoderError:
        case ErrorCode::InvalidData:
            return true;
        default:
            return false;
    }
}

} // namespace reel
