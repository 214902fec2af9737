/**
 * @file image_convert.hpp
 * @brief Pixel format normalisation for decoded images
 */

#pragma once

#include <reel/core/result.hpp>
#include <reel/media/frame.hpp>
#include <reel/media/image_reader.hpp>
#include <optional>
#include <string>

namespace reel::media {

/**
 * @brief 8 bit RGB colour
 */
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

/**
 * @brief Colour of a single character colour code
 *
 * 'k' black, 'b' blue, 'g' green, 'c' cyan, 'r' red, 'm' magenta,
 * 'y' yellow, 'w' white.
 *
 * @return The colour, or nullopt for any other character
 */
std::optional<Rgb> colorFromChar(char c);

/**
 * @brief Parse a background setting
 *
 * "checkerboard" (or an empty string) selects the checkerboard, a single
 * colour character selects that colour.
 *
 * @return nullopt for the checkerboard, a colour otherwise, or
 *         InvalidArgument for anything else
 */
Result<std::optional<Rgb>, Error> parseBackground(const std::string& value);

/**
 * @brief Replace palette indices by their true colour
 *
 * @param indices One channel UInt8 or UInt16 frame of 0-based indices
 * @return Three channel UInt8 frame, InvalidData for an index outside the palette
 */
Result<Frame, Error> expandPalette(const Frame& indices, const std::vector<PaletteEntry>& palette);

/**
 * @brief Grey checkerboard used behind transparent images
 *
 * Squares alternate between grey levels 85 and 171; their size grows
 * slowly with the image size.
 */
Frame checkerboard(int width, int height);

/**
 * @brief Normalise a decoded image to packed 8 bit RGB
 *
 * Palettes are expanded, grey images replicated to three channels, deeper
 * sample types scaled to 8 bits, and transparency composited over
 * background (or the checkerboard when background is nullopt).
 */
Result<Frame, Error> toRgb8(const DecodedImage& image,
                            const std::optional<Rgb>& background = std::nullopt);

} // namespace reel::media
