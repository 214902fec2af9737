/**
 * @file video_decoder.hpp
 * @brief Video file backend (PIMPL)
 *
 * Decodes the best video stream of a container file into RGB24 frames.
 * The FFmpeg contexts live in the implementation so that no FFmpeg
 * header leaks into the public interface.
 */

#pragma once

#include <reel/core/types.hpp>
#include <reel/core/result.hpp>
#include <reel/media/frame_source.hpp>
#include <filesystem>
#include <memory>

namespace reel::media {

/**
 * @brief Decoder configuration
 */
struct VideoDecoderConfig {
    std::filesystem::path path;   // Media file path
    int threadCount = 0;          // 0 = auto
};

/**
 * @brief Video file frame source
 *
 * setCurrentTime() seeks to the keyframe at or before the target and
 * the next readNextFrame() decodes forward to the frame nearest the
 * target, so positioning is frame accurate for constant frame rate files.
 */
class VideoDecoder : public FrameSource {
public:
    ~VideoDecoder() override;

    VideoDecoder(const VideoDecoder&) = delete;
    VideoDecoder& operator=(const VideoDecoder&) = delete;

    /**
     * @brief Open a video file
     *
     * @return Decoder, or an I/O error if the file cannot be opened or has
     *         no decodable video stream
     */
    static Result<std::unique_ptr<VideoDecoder>, Error> open(const VideoDecoderConfig& config);

    /// Picture size of the video stream
    [[nodiscard]] Size resolution() const;

    /// Name of the codec, e.g. "h264"
    [[nodiscard]] std::string codecName() const;

    [[nodiscard]] const std::filesystem::path& path() const;

    // FrameSource
    [[nodiscard]] Rational frameRate() const override;
    [[nodiscard]] Duration duration() const override;
    [[nodiscard]] int64_t frameCount() const override;
    [[nodiscard]] Timestamp currentTime() const override;
    Result<void, Error> setCurrentTime(Timestamp time) override;
    Result<Frame, Error> readNextFrame() override;
    [[nodiscard]] bool hasFrameRemaining() const override;
    [[nodiscard]] SourceInfo info() const override;

private:
    VideoDecoder();

    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace reel::media
