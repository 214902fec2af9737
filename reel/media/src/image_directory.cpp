#include <reel/media/image_directory.hpp>
#include <reel/media/media_formats.hpp>
#include <reel/core/logger.hpp>
#include <system_error>

namespace reel::media {

Result<std::vector<std::string>, Error> listImages(const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return Error(ErrorCode::NotFound, "Not a directory: " + directory.string());
    }

    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        REEL_LOG_WARN("Cannot list {}: {}", directory.string(), ec.message());
        return Error(ErrorCode::ReadError, "Cannot list " + directory.string() + ": " + ec.message());
    }

    std::vector<std::string> names;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && isImageFile(it->path())) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return Error(ErrorCode::ReadError, "Cannot list " + directory.string() + ": " + ec.message());
    }
    return names;
}

} // namespace reel::media
