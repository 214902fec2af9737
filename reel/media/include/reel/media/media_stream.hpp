/**
 * @file media_stream.hpp
 * @brief Random access frame reader over a video file or image sequence
 *
 * MediaStream gives 1-based random access to the frames of a backend
 * (FrameSource). Decoded frames are kept in a small LRU cache, and reads of
 * consecutive frames are served without repositioning the backend, so
 * scrubbing and sequential playback are both cheap.
 *
 * Usage:
 * @code
 *   auto opened = MediaStream::open("shot.0001.png");
 *   if (!opened) { ... }
 *   MediaStream stream = std::move(opened).value();
 *
 *   while (stream.hasFrameRemaining()) {
 *       auto frame = stream.readNextFrame();
 *       ...
 *   }
 *   auto last = stream.read(kLastFrame);
 * @endcode
 */

#pragma once

#include <reel/core/types.hpp>
#include <reel/core/result.hpp>
#include <reel/core/config.hpp>
#include <reel/media/frame.hpp>
#include <reel/media/frame_source.hpp>
#include <reel/media/image_convert.hpp>
#include <reel/media/image_reader.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace reel::media {

/**
 * @brief Options for MediaStream::open
 */
struct StreamOptions {
    size_t cacheCapacity = 1;               // Decoded frames kept, minimum 1
    Rational sequenceFrameRate{30, 1};      // Nominal rate of image sequences
    std::shared_ptr<ImageReader> imageReader;  // nullptr = FFmpeg reader
    int decoderThreads = 0;                 // 0 = auto
    bool normalizeRgb = false;              // Sequence frames as 8 bit RGB
    std::optional<Rgb> background;          // nullopt = checkerboard

    /**
     * @brief Build options from the stream, sequence, image and video keys
     *
     * @return Options, or InvalidArgument for an unknown background or a
     *         non-positive frame rate
     */
    static Result<StreamOptions, Error> fromConfig(const Config& config);
};

/**
 * @brief Stream statistics
 */
struct StreamStats {
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;
    uint64_t repositions = 0;     // Backend setCurrentTime() calls
    uint64_t framesDecoded = 0;   // Successful backend reads
};

/**
 * @brief Cached random access over a FrameSource
 *
 * All reads and close() are serialised by an internal mutex. A closed or
 * moved-from stream fails every read with StreamClosed.
 */
class MediaStream {
public:
    /**
     * @brief Wrap an opened backend
     *
     * @param source Backend, owned by the stream from now on
     * @param cacheCapacity Number of decoded frames kept (minimum 1)
     * @param name Name reported by info() and in log messages
     */
    explicit MediaStream(std::unique_ptr<FrameSource> source, size_t cacheCapacity = 1,
                         std::string name = {});
    ~MediaStream();

    // Move only (not copyable)
    MediaStream(MediaStream&& other) noexcept;
    MediaStream& operator=(MediaStream&& other) noexcept;
    MediaStream(const MediaStream&) = delete;
    MediaStream& operator=(const MediaStream&) = delete;

    // ========== Open/Close ==========

    /**
     * @brief Open a video file or an image sequence
     *
     * The backend is chosen from the file extension (case-insensitive).
     * For an image sequence, path names the first frame.
     *
     * @return Stream, UnsupportedFormat for an unknown extension, or the
     *         backend's error
     */
    static Result<MediaStream, Error> open(const std::filesystem::path& path,
                                           const StreamOptions& options = {});

    /**
     * @brief Release the backend and drop cached frames
     *
     * Safe to call more than once.
     */
    void close();

    [[nodiscard]] bool isOpen() const;

    // ========== Random Access ==========

    /**
     * @brief Get a frame
     *
     * Served from the cache when resident; otherwise decoded, repositioning
     * the backend unless frameIndex directly follows the last decoded frame.
     *
     * @param frameIndex 1-based index, or kLastFrame
     * @return The frame, OutOfRange outside [1, numFrames()], StreamClosed,
     *         or the backend's error
     */
    Result<Frame, Error> read(int64_t frameIndex);

    /// Number of frames, fixed when the stream was opened
    [[nodiscard]] int64_t numFrames() const;

    // ========== Sequential Access ==========

    /// Index of the last frame read, 0 before the first read
    [[nodiscard]] int64_t currentFrame() const;

    [[nodiscard]] bool hasFrameRemaining() const;

    /**
     * @brief Read the frame after currentFrame()
     *
     * @return The frame, or EndOfStream after the last frame
     */
    Result<Frame, Error> readNextFrame();

    /**
     * @brief Move to a frame
     *
     * @return True if the frame holds pixel data
     */
    Result<bool, Error> seek(int64_t frameIndex);

    /// Move relative to currentFrame()
    Result<bool, Error> step(int64_t delta);

    /// step(1)
    Result<bool, Error> next();

    /// The frame at currentFrame()
    Result<Frame, Error> currentFrameData();

    /// next(), then the frame at the new position
    Result<Frame, Error> nextFrame();

    // ========== Properties ==========

    /// Properties of the backend, or StreamClosed
    Result<SourceInfo, Error> info() const;

    [[nodiscard]] StreamStats stats() const;

    [[nodiscard]] const std::string& name() const;

private:
    /// read(currentFrame() + delta) under a single lock
    Result<Frame, Error> readRelative(int64_t delta);

    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace reel::media
