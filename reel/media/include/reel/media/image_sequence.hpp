/**
 * @file image_sequence.hpp
 * @brief A directory of numbered image files read as a video
 *
 * The file name is assumed to contain an integer which increments by one
 * for each consecutive frame, e.g.
 *    input.98.jpg, input.99.jpg, input.100.jpg
 * The integer may be zero padded, e.g.
 *    0000.png, 0001.png, 0002.png
 */

#pragma once

#include <reel/core/types.hpp>
#include <reel/core/result.hpp>
#include <reel/media/frame_source.hpp>
#include <reel/media/image_convert.hpp>
#include <reel/media/image_reader.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace reel::media {

/**
 * @brief File naming pattern of a sequence
 *
 * <prefix><number><suffix>, where number is the last run of decimal
 * digits in the file name (extension excluded) and is zero padded to
 * padding digits.
 */
struct SequencePattern {
    std::filesystem::path directory;
    std::string prefix;
    std::string suffix;        ///< Includes the extension
    int padding = 1;
    int64_t firstNumber = 0;   ///< Number in the file the pattern was parsed from

    /**
     * @brief Derive the pattern from one file of the sequence
     *
     * @return The pattern, or SequenceNotDetected if the file name has no digits
     */
    static Result<SequencePattern, Error> parse(const std::filesystem::path& file);

    /// Path of the file carrying a number
    [[nodiscard]] std::filesystem::path pathFor(int64_t number) const;
};

/**
 * @brief Options for opening an image sequence
 */
struct SequenceOptions {
    /// Nominal rate used to map frame indices to time
    Rational frameRate{30, 1};

    /// Return every frame as 8 bit RGB with transparency composited
    bool normalizeToRgb8 = false;

    /// Compositing background, nullopt for the checkerboard
    std::optional<Rgb> background;
};

/**
 * @brief Image sequence backend
 *
 * The number of frames is found once, when the sequence is opened, by
 * checking successive file names until one cannot be opened. Width,
 * height and pixel format are those of the first frame.
 */
class ImageSequence : public FrameSource {
public:
    ~ImageSequence() override;

    ImageSequence(const ImageSequence&) = delete;
    ImageSequence& operator=(const ImageSequence&) = delete;

    /**
     * @brief Open the sequence starting at a file
     *
     * The named file is frame 1.
     *
     * @param firstFrame Path of the first frame
     * @param reader Decoder for individual files
     * @return The sequence, SequenceNotDetected if the name has no number,
     *         or an I/O error if the first frame cannot be decoded
     */
    static Result<std::unique_ptr<ImageSequence>, Error> open(
        const std::filesystem::path& firstFrame,
        std::shared_ptr<ImageReader> reader,
        const SequenceOptions& options = {});

    /**
     * @brief Decode a frame
     *
     * @param frameIndex 1-based frame index
     * @return The frame, OutOfRange outside [1, frameCount()], or an I/O error
     */
    Result<Frame, Error> read(int64_t frameIndex);

    /// Path of a frame (1-based), without checking that it exists
    [[nodiscard]] std::filesystem::path framePath(int64_t frameIndex) const;

    [[nodiscard]] const SequencePattern& pattern() const { return m_pattern; }

    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }
    [[nodiscard]] int channels() const { return m_channels; }
    [[nodiscard]] int bitsPerPixel() const { return m_bitsPerPixel; }

    // FrameSource
    [[nodiscard]] Rational frameRate() const override { return m_options.frameRate; }
    [[nodiscard]] Duration duration() const override;
    [[nodiscard]] int64_t frameCount() const override { return m_frameCount; }
    [[nodiscard]] Timestamp currentTime() const override;
    Result<void, Error> setCurrentTime(Timestamp time) override;
    Result<Frame, Error> readNextFrame() override;
    [[nodiscard]] bool hasFrameRemaining() const override;
    [[nodiscard]] SourceInfo info() const override;

private:
    ImageSequence(std::filesystem::path name, SequencePattern pattern,
                  std::shared_ptr<ImageReader> reader, const SequenceOptions& options,
                  int64_t frameCount);

    std::filesystem::path m_name;
    SequencePattern m_pattern;
    std::shared_ptr<ImageReader> m_reader;
    SequenceOptions m_options;
    int64_t m_frameCount = 0;

    // Zero-based index of the frame readNextFrame() returns
    int64_t m_cursor = 0;

    int m_width = 0;
    int m_height = 0;
    int m_channels = 0;
    int m_bitsPerPixel = 0;
    std::string m_videoFormat;
};

/**
 * @brief Count the consecutive files of a pattern starting at its first number
 *
 * Stops at the first number whose file cannot be opened for reading.
 */
int64_t probeSequenceLength(const SequencePattern& pattern);

} // namespace reel::media
