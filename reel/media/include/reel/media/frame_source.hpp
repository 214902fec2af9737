/**
 * @file frame_source.hpp
 * @brief Backend interface behind MediaStream
 *
 * A FrameSource is a forward decoding cursor that can be repositioned in
 * time, in the manner of a conventional video reader. Video files and
 * image sequences both implement it.
 */

#pragma once

#include <reel/core/types.hpp>
#include <reel/core/result.hpp>
#include <reel/media/frame.hpp>
#include <string>

namespace reel::media {

/**
 * @brief Descriptive properties of a source
 */
struct SourceInfo {
    std::string name;          ///< Path the source was opened from
    std::string type;          ///< "imseq" or "video"
    std::string videoFormat;   ///< e.g. "RGB24", "Gray8"
    int width = 0;
    int height = 0;
    int bitsPerPixel = 0;
    Rational frameRate;
    Duration duration = 0;     ///< Microseconds
    int64_t frameCount = 0;
};

/**
 * @brief Frame producing backend
 *
 * Repositioning with setCurrentTime() is assumed to be expensive compared
 * to readNextFrame(); callers reading sequentially should not seek.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /// Nominal frame rate
    [[nodiscard]] virtual Rational frameRate() const = 0;

    /// Total duration in microseconds
    [[nodiscard]] virtual Duration duration() const = 0;

    /// Number of frames, computed once when the source was opened
    [[nodiscard]] virtual int64_t frameCount() const = 0;

    /// Presentation time of the frame the next readNextFrame() returns
    [[nodiscard]] virtual Timestamp currentTime() const = 0;

    /**
     * @brief Reposition the decode cursor
     *
     * @param time Target time in microseconds
     */
    virtual Result<void, Error> setCurrentTime(Timestamp time) = 0;

    /**
     * @brief Decode the frame at the cursor and advance past it
     */
    virtual Result<Frame, Error> readNextFrame() = 0;

    /// True while readNextFrame() has a frame to return
    [[nodiscard]] virtual bool hasFrameRemaining() const = 0;

    /// Descriptive properties
    [[nodiscard]] virtual SourceInfo info() const = 0;
};

} // namespace reel::media
