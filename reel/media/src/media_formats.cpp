/**
 * @file media_formats.cpp
 * @brief Extension tables and lookup
 */

#include <reel/media/media_formats.hpp>
#include <algorithm>
#include <cctype>

namespace reel::media {

namespace {

const std::vector<std::string> kImageExtensions = {
    "bmp", "tif", "tiff", "jpeg", "jpg", "png", "ppm", "pgm", "pbm", "gif"
};

const std::vector<std::string> kVideoExtensions = {
    "mpg", "avi", "mp4", "m4v", "mpeg", "mxf", "mj2", "wmv", "asf", "asx", "mov", "ogg"
};

std::string extensionOf(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool contains(const std::vector<std::string>& list, const std::string& ext) {
    return std::find(list.begin(), list.end(), ext) != list.end();
}

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

} // anonymous namespace

StreamKind detectStreamKind(const std::filesystem::path& path) {
    std::string ext = extensionOf(path);

    if (contains(kImageExtensions, ext)) {
        return StreamKind::ImageSequence;
    }
    if (contains(kVideoExtensions, ext)) {
        return StreamKind::Video;
    }
    return StreamKind::Unknown;
}

bool isImageFile(const std::filesystem::path& path) {
    return contains(kImageExtensions, extensionOf(path));
}

const std::vector<std::string>& imageSequenceExtensions() {
    return kImageExtensions;
}

const std::vector<std::string>& videoExtensions() {
    return kVideoExtensions;
}

std::vector<FileFormat> supportedFileFormats() {
    std::vector<FileFormat> formats;
    for (const auto& ext : kVideoExtensions) {
        formats.push_back({ext, toUpper(ext) + " video file", StreamKind::Video});
    }
    for (const auto& ext : kImageExtensions) {
        formats.push_back({ext, toUpper(ext) + " file sequence", StreamKind::ImageSequence});
    }
    return formats;
}

} // namespace reel::media
