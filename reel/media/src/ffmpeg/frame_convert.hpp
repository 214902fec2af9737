/**
 * @file frame_convert.hpp
 * @brief Conversion of decoded AVFrames into reel frames
 */

#pragma once

#include "ff_common.hpp"
#include <reel/media/frame.hpp>
#include <reel/media/image_reader.hpp>

namespace reel::media::ff {

/**
 * @brief Convert a software AVFrame to packed RGB24
 */
Result<Frame, Error> toRgb24(const AVFrame* frame);

/**
 * @brief Convert a software AVFrame keeping depth, palette and alpha
 *
 * PAL8 pictures keep their indices and palette; other formats become
 * packed grey or RGB at 8 or 16 bits, with alpha split into its own plane.
 */
Result<DecodedImage, Error> toDecodedImage(const AVFrame* frame);

} // namespace reel::media::ff
