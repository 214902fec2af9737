/**
 * @file image_directory.hpp
 * @brief Listing of the image files in a directory
 */

#pragma once

#include <reel/core/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace reel::media {

/**
 * @brief Names of the image files in a directory
 *
 * Only regular files with an image sequence extension (case-insensitive)
 * are returned, in the order the operating system lists them.
 *
 * @param directory Directory to search, the current directory by default
 * @return File names without the directory, or NotFound / ReadError
 */
Result<std::vector<std::string>, Error> listImages(const std::filesystem::path& directory = ".");

} // namespace reel::media
