#include "frame_convert.hpp"
#include "shared_avframe.hpp"
#include <cstring>

namespace reel::media::ff {

namespace {

Result<void, Error> checkSource(const AVFrame* frame) {
    if (!frame || frame->width <= 0 || frame->height <= 0 || frame->format == AV_PIX_FMT_NONE) {
        return Error(ErrorCode::InvalidData, "Empty decoded picture");
    }
    return Ok();
}

/// Scale the whole picture into a packed destination buffer
Result<void, Error> scaleInto(const AVFrame* src, AVPixelFormat dstFormat, uint8_t* dst, int dstStride) {
    auto srcFormat = static_cast<AVPixelFormat>(src->format);

    SwsContextPtr sws(sws_getContext(src->width, src->height, srcFormat,
                                     src->width, src->height, dstFormat,
                                     SWS_BICUBIC, nullptr, nullptr, nullptr));
    if (!sws) {
        const char* name = av_get_pix_fmt_name(srcFormat);
        return Error(ErrorCode::NotSupported,
            std::string("Cannot convert pixel format ") + (name ? name : "unknown"));
    }

    uint8_t* dstData[4] = {dst, nullptr, nullptr, nullptr};
    int dstLinesize[4] = {dstStride, 0, 0, 0};
    int rows = sws_scale(sws.get(), src->data, src->linesize, 0, src->height, dstData, dstLinesize);
    if (rows <= 0) {
        return Error(ErrorCode::DecoderError, "Pixel format conversion failed");
    }
    return Ok();
}

Result<DecodedImage, Error> fromPalette(const AVFrame* src) {
    auto created = Frame::create(src->width, src->height, 1, SampleType::UInt8);
    if (!created) {
        return created.error();
    }

    DecodedImage image;
    image.pixels = std::move(created).value();
    for (int y = 0; y < src->height; ++y) {
        std::memcpy(image.pixels.row(y), src->data[0] + static_cast<ptrdiff_t>(y) * src->linesize[0],
                    static_cast<size_t>(src->width));
    }

    // PAL8 palette: 256 native endian 0xAARRGGBB words in data[1]
    const auto* colors = reinterpret_cast<const uint32_t*>(src->data[1]);
    image.palette.resize(256);
    for (int i = 0; i < 256; ++i) {
        image.palette[i] = {static_cast<uint8_t>(colors[i] >> 16),
                            static_cast<uint8_t>(colors[i] >> 8),
                            static_cast<uint8_t>(colors[i])};
    }

    // Entries past the decoder's palette size hold garbage alpha, so only
    // indices present in the picture count
    bool used[256] = {};
    for (int y = 0; y < src->height; ++y) {
        const uint8_t* row = image.pixels.row(y);
        for (int x = 0; x < src->width; ++x) {
            used[row[x]] = true;
        }
    }
    bool translucent = false;
    for (int i = 0; i < 256 && !translucent; ++i) {
        translucent = used[i] && (colors[i] >> 24) != 0xFF;
    }

    if (translucent) {
        auto alpha = Frame::create(src->width, src->height, 1, SampleType::UInt8);
        if (!alpha) {
            return alpha.error();
        }
        image.alpha = std::move(alpha).value();
        for (int y = 0; y < src->height; ++y) {
            for (int x = 0; x < src->width; ++x) {
                uint8_t index = image.pixels.sample<uint8_t>(x, y, 0);
                image.alpha.setSample<uint8_t>(x, y, 0, static_cast<uint8_t>(colors[index] >> 24));
            }
        }
    }
    return image;
}

} // anonymous namespace

Result<Frame, Error> toRgb24(const AVFrame* frame) {
    auto valid = checkSource(frame);
    if (!valid) {
        return valid.error();
    }

    auto created = Frame::create(frame->width, frame->height, 3, SampleType::UInt8);
    if (!created) {
        return created.error();
    }
    Frame rgb = std::move(created).value();

    auto scaled = scaleInto(frame, AV_PIX_FMT_RGB24, rgb.data(), static_cast<int>(rgb.stride()));
    if (!scaled) {
        return scaled.error();
    }
    return rgb;
}

Result<DecodedImage, Error> toDecodedImage(const AVFrame* frame) {
    auto valid = checkSource(frame);
    if (!valid) {
        return valid.error();
    }

    auto srcFormat = static_cast<AVPixelFormat>(frame->format);
    if (srcFormat == AV_PIX_FMT_PAL8) {
        return fromPalette(frame);
    }

    const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(srcFormat);
    if (!desc) {
        return Error(ErrorCode::NotSupported, "Unknown pixel format");
    }

    const bool hasAlpha = (desc->flags & AV_PIX_FMT_FLAG_ALPHA) != 0;
    const int colorChannels = (desc->nb_components - (hasAlpha ? 1 : 0)) == 1 ? 1 : 3;
    const bool deep = desc->comp[0].depth > 8;

    AVPixelFormat dstFormat;
    if (colorChannels == 1) {
        dstFormat = hasAlpha ? (deep ? AV_PIX_FMT_YA16 : AV_PIX_FMT_YA8)
                             : (deep ? AV_PIX_FMT_GRAY16 : AV_PIX_FMT_GRAY8);
    } else {
        dstFormat = hasAlpha ? (deep ? AV_PIX_FMT_RGBA64 : AV_PIX_FMT_RGBA)
                             : (deep ? AV_PIX_FMT_RGB48 : AV_PIX_FMT_RGB24);
    }

    const SampleType type = deep ? SampleType::UInt16 : SampleType::UInt8;
    const int packedChannels = colorChannels + (hasAlpha ? 1 : 0);

    auto created = Frame::create(frame->width, frame->height, packedChannels, type);
    if (!created) {
        return created.error();
    }
    Frame packed = std::move(created).value();

    auto scaled = scaleInto(frame, dstFormat, packed.data(), static_cast<int>(packed.stride()));
    if (!scaled) {
        return scaled.error();
    }

    DecodedImage image;
    if (!hasAlpha) {
        image.pixels = std::move(packed);
        return image;
    }

    // Split the interleaved alpha channel into its own plane
    auto pixels = Frame::create(frame->width, frame->height, colorChannels, type);
    auto alpha = Frame::create(frame->width, frame->height, 1, type);
    if (!pixels || !alpha) {
        return Error(ErrorCode::OutOfMemory, "Failed to allocate image planes");
    }
    image.pixels = std::move(pixels).value();
    image.alpha = std::move(alpha).value();

    const size_t sampleBytes = static_cast<size_t>(bytesPerSample(type));
    for (int y = 0; y < frame->height; ++y) {
        const uint8_t* in = packed.row(y);
        uint8_t* color = image.pixels.row(y);
        uint8_t* matte = image.alpha.row(y);
        for (int x = 0; x < frame->width; ++x) {
            std::memcpy(color, in, sampleBytes * colorChannels);
            std::memcpy(matte, in + sampleBytes * colorChannels, sampleBytes);
            in += sampleBytes * packedChannels;
            color += sampleBytes * colorChannels;
            matte += sampleBytes;
        }
    }
    return image;
}

} // namespace reel::media::ff
