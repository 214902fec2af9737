/**
 * @file image_reader.cpp
 * @brief FFmpeg backed ImageReader
 */

#include <reel/media/image_reader.hpp>
#include <reel/core/logger.hpp>
#include "ffmpeg/input_context.hpp"
#include "ffmpeg/frame_convert.hpp"

namespace reel::media {

namespace {

class FFmpegImageReader : public ImageReader {
public:
    Result<DecodedImage, Error> read(const std::filesystem::path& path) override {
        ff::InputContext input;
        auto opened = input.open(path, 1);
        if (!opened) {
            REEL_LOG_DEBUG("Cannot open image {}: {}", path.string(), opened.error().what());
            return opened.error();
        }

        auto decoded = input.decodeNext();
        if (!decoded) {
            Error error = decoded.error();
            if (error.code() == ErrorCode::EndOfFile) {
                error = Error(ErrorCode::InvalidData, "No picture in " + path.string());
            }
            REEL_LOG_WARN("Failed to decode image {}: {}", path.string(), error.what());
            return error;
        }

        return ff::toDecodedImage(decoded.value().get());
    }
};

} // anonymous namespace

std::shared_ptr<ImageReader> createImageReader() {
    return std::make_shared<FFmpegImageReader>();
}

} // namespace reel::media
