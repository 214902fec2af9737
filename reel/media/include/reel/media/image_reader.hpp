/**
 * @file image_reader.hpp
 * @brief Single image file decoding
 */

#pragma once

#include <reel/core/result.hpp>
#include <reel/media/frame.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace reel::media {

/**
 * @brief One colour of an indexed image's palette
 */
struct PaletteEntry {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

/**
 * @brief Result of decoding one image file
 *
 * When palette is non-empty, pixels holds one channel of 0-based palette
 * indices. alpha is either empty or a one channel frame of the same size
 * and sample type as pixels.
 */
struct DecodedImage {
    Frame pixels;
    std::vector<PaletteEntry> palette;
    Frame alpha;

    [[nodiscard]] bool isIndexed() const { return !palette.empty(); }
    [[nodiscard]] bool hasAlpha() const { return alpha.isValid(); }
};

/**
 * @brief Decoder for individual image files
 *
 * Multi-frame files (animated GIF) yield their first frame.
 */
class ImageReader {
public:
    virtual ~ImageReader() = default;

    /**
     * @brief Decode an image file
     *
     * @return Decoded image, or an I/O error code when the file cannot be
     *         opened or decoded
     */
    virtual Result<DecodedImage, Error> read(const std::filesystem::path& path) = 0;
};

/**
 * @brief Create the FFmpeg based reader
 *
 * Keeps the source bit depth: 8 bit formats give UInt8 frames, deeper
 * formats UInt16. Colour images are packed RGB, grey images one channel.
 */
std::shared_ptr<ImageReader> createImageReader();

} // namespace reel::media
