/**
 * @file video_decoder.cpp
 * @brief VideoDecoder implementation using FFmpeg
 */

#include <reel/media/video_decoder.hpp>
#include <reel/core/logger.hpp>
#include "ffmpeg/input_context.hpp"
#include "ffmpeg/frame_convert.hpp"
#include <cmath>
#include <string>

namespace reel::media {

// ============================================================================
// VideoDecoder Implementation
// ============================================================================

struct VideoDecoder::Impl {
    VideoDecoderConfig config;
    ff::InputContext input;

    Rational rate;
    Duration totalDuration = 0;
    int64_t totalFrames = 0;
    Duration frameDuration = 0;

    // Stream start time in microseconds, subtracted from every pts
    Timestamp startTime = 0;

    // Presentation time of the frame the next read returns
    Timestamp cursor = 0;

    // Frames before this time are discarded after a seek
    Timestamp pendingTarget = kNoTimestamp;

    bool eof = false;

    Result<void, Error> open() {
        auto opened = input.open(config.path, config.threadCount);
        if (!opened) {
            return opened.error();
        }

        AVStream* stream = input.stream();

        AVRational avgRate = stream->avg_frame_rate;
        if (avgRate.num <= 0 || avgRate.den <= 0) {
            avgRate = stream->r_frame_rate;
        }
        rate = ff::fromAVRational(avgRate);
        if (!rate.isValid()) {
            return Error(ErrorCode::InvalidData, "Unknown frame rate in " + config.path.string());
        }
        frameDuration = frameToTimestamp(1, rate);

        if (input.format()->duration != AV_NOPTS_VALUE && input.format()->duration > 0) {
            // Container duration is in AV_TIME_BASE units (microseconds)
            totalDuration = input.format()->duration;
        } else if (stream->duration != AV_NOPTS_VALUE) {
            totalDuration = ff::toMicroseconds(stream->duration, stream->time_base);
        }

        if (stream->start_time != AV_NOPTS_VALUE) {
            startTime = ff::toMicroseconds(stream->start_time, stream->time_base);
        }

        const double seconds = static_cast<double>(totalDuration) / kTimeBaseUs;
        totalFrames = static_cast<int64_t>(std::llround(seconds * rate.toDouble()));
        if (totalFrames <= 0 && stream->nb_frames > 0) {
            totalFrames = stream->nb_frames;
            totalDuration = frameToTimestamp(totalFrames, rate);
        }
        return Ok();
    }

    Timestamp framePts(const AVFrame* frame) const {
        int64_t pts = frame->best_effort_timestamp;
        if (pts == AV_NOPTS_VALUE) {
            pts = frame->pts;
        }
        if (pts == AV_NOPTS_VALUE) {
            return cursor;
        }
        return ff::toMicroseconds(pts, input.stream()->time_base) - startTime;
    }

    Result<void, Error> seekTo(Timestamp time) {
        if (time < 0 || time > totalDuration) {
            return Error(ErrorCode::OutOfRange,
                "Time " + std::to_string(time) + "us is outside the video");
        }

        AVStream* stream = input.stream();
        int64_t target = ff::fromMicroseconds(time + startTime, stream->time_base);
        auto sought = input.seek(target);
        if (!sought) {
            return sought.error();
        }

        pendingTarget = time;
        cursor = time;
        eof = false;
        REEL_LOG_TRACE("Seek {} to {}us", config.path.string(), time);
        return Ok();
    }

    Result<Frame, Error> readNext() {
        if (eof) {
            return Error(ErrorCode::EndOfFile, "End of video stream");
        }

        while (true) {
            auto decoded = input.decodeNext();
            if (!decoded) {
                if (decoded.error().code() == ErrorCode::EndOfFile) {
                    eof = true;
                }
                return decoded.error();
            }

            const ff::SharedAVFrame& frame = decoded.value();
            const Timestamp pts = framePts(frame.get());

            // After a seek, decode forward until the frame nearest the target
            if (pendingTarget != kNoTimestamp && (pendingTarget - pts) * 2 > frameDuration) {
                continue;
            }
            pendingTarget = kNoTimestamp;

            auto rgb = ff::toRgb24(frame.get());
            if (!rgb) {
                return rgb.error();
            }

            cursor = pts + frameDuration;
            return rgb;
        }
    }
};

// ============================================================================
// VideoDecoder Public Interface
// ============================================================================

VideoDecoder::VideoDecoder() : m_impl(std::make_unique<Impl>()) {}
VideoDecoder::~VideoDecoder() = default;

Result<std::unique_ptr<VideoDecoder>, Error> VideoDecoder::open(const VideoDecoderConfig& config) {
    std::unique_ptr<VideoDecoder> decoder(new VideoDecoder());
    decoder->m_impl->config = config;

    auto opened = decoder->m_impl->open();
    if (!opened) {
        REEL_LOG_WARN("Failed to open video {}: {}", config.path.string(), opened.error().what());
        return opened.error();
    }

    REEL_LOG_DEBUG("Video {}: {} {}x{} {}/{} fps, {} frames", config.path.string(),
                   decoder->codecName(), decoder->resolution().width, decoder->resolution().height,
                   decoder->m_impl->rate.num, decoder->m_impl->rate.den, decoder->m_impl->totalFrames);
    return std::move(decoder);
}

Size VideoDecoder::resolution() const {
    AVCodecContext* codec = m_impl->input.codec();
    if (!codec) return {0, 0};
    return {codec->width, codec->height};
}

std::string VideoDecoder::codecName() const {
    AVCodecContext* codec = m_impl->input.codec();
    if (!codec || !codec->codec) return {};
    return codec->codec->name;
}

const std::filesystem::path& VideoDecoder::path() const {
    return m_impl->config.path;
}

Rational VideoDecoder::frameRate() const {
    return m_impl->rate;
}

Duration VideoDecoder::duration() const {
    return m_impl->totalDuration;
}

int64_t VideoDecoder::frameCount() const {
    return m_impl->totalFrames;
}

Timestamp VideoDecoder::currentTime() const {
    return m_impl->cursor;
}

Result<void, Error> VideoDecoder::setCurrentTime(Timestamp time) {
    return m_impl->seekTo(time);
}

Result<Frame, Error> VideoDecoder::readNextFrame() {
    return m_impl->readNext();
}

bool VideoDecoder::hasFrameRemaining() const {
    return !m_impl->eof && m_impl->cursor < m_impl->totalDuration;
}

SourceInfo VideoDecoder::info() const {
    SourceInfo info;
    info.name = m_impl->config.path.string();
    info.type = "video";
    info.videoFormat = "RGB24";
    info.width = resolution().width;
    info.height = resolution().height;
    info.bitsPerPixel = 24;
    info.frameRate = m_impl->rate;
    info.duration = m_impl->totalDuration;
    info.frameCount = m_impl->totalFrames;
    return info;
}

} // namespace reel::media
