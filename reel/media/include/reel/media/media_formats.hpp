/**
 * @file media_formats.hpp
 * @brief File extensions understood by MediaStream
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace reel::media {

/**
 * @brief Backend a file is opened with
 */
enum class StreamKind {
    Unknown = 0,
    ImageSequence,  // First file of a numbered image sequence
    Video,          // Container decoded by FFmpeg
};

/**
 * @brief One supported file format
 */
struct FileFormat {
    std::string extension;     // Lower case, without the dot
    std::string description;
    StreamKind kind = StreamKind::Unknown;
};

/// Backend for a file name, from its extension (case-insensitive)
StreamKind detectStreamKind(const std::filesystem::path& path);

/// True if the extension is one of the image sequence extensions
bool isImageFile(const std::filesystem::path& path);

/// Image sequence extensions (lower case, without the dot)
const std::vector<std::string>& imageSequenceExtensions();

/// Video container extensions (lower case, without the dot)
const std::vector<std::string>& videoExtensions();

/// Every supported format, image sequences after videos
std::vector<FileFormat> supportedFileFormats();

} // namespace reel::media
