/**
 * @file ff_common.hpp
 * @brief Common FFmpeg includes and utilities
 *
 * FFmpeg headers are only included from reel/media/src, never from the
 * public headers.
 */

#pragma once

// FFmpeg C headers
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

#include <reel/core/types.hpp>
#include <reel/core/result.hpp>
#include <string>

namespace reel::media::ff {

/**
 * @brief Convert FFmpeg error code to string
 */
inline std::string avErrorString(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

/**
 * @brief Convert FFmpeg error to reel Error
 *
 * @param fallback Code used for errors without a more specific mapping
 */
inline Error avError(int errnum, const std::string& context = "",
                     ErrorCode fallback = ErrorCode::DecoderError) {
    std::string msg = context;
    if (!msg.empty()) msg += ": ";
    msg += avErrorString(errnum);

    ErrorCode code = fallback;
    if (errnum == AVERROR(ENOMEM)) {
        code = ErrorCode::OutOfMemory;
    } else if (errnum == AVERROR(ENOENT)) {
        code = ErrorCode::FileNotFound;
    } else if (errnum == AVERROR_EOF) {
        code = ErrorCode::EndOfFile;
    } else if (errnum == AVERROR_DECODER_NOT_FOUND) {
        code = ErrorCode::CodecNotFound;
    } else if (errnum == AVERROR_INVALIDDATA) {
        code = ErrorCode::InvalidData;
    }

    return Error(code, msg);
}

/**
 * @brief Convert AVRational to reel Rational
 */
inline Rational fromAVRational(AVRational r) {
    return {r.num, r.den};
}

/**
 * @brief Convert timestamp from AVStream time_base to microseconds
 */
inline Timestamp toMicroseconds(int64_t pts, AVRational timeBase) {
    if (pts == AV_NOPTS_VALUE) return kNoTimestamp;
    return av_rescale_q(pts, timeBase, {1, 1000000});
}

/**
 * @brief Convert microseconds to AVStream time_base
 */
inline int64_t fromMicroseconds(Timestamp us, AVRational timeBase) {
    if (us == kNoTimestamp) return AV_NOPTS_VALUE;
    return av_rescale_q(us, {1, 1000000}, timeBase);
}

} // namespace reel::media::ff
