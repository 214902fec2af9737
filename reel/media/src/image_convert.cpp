#include <reel/media/image_convert.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace reel::media {

namespace {

/// Sample value scaled to [0, 1]
double normalizedSample(const Frame& frame, int x, int y, int channel) {
    switch (frame.sampleType()) {
        case SampleType::UInt8:
            return frame.sample<uint8_t>(x, y, channel) / 255.0;
        case SampleType::UInt16:
            return frame.sample<uint16_t>(x, y, channel) / 65535.0;
        case SampleType::UInt32:
            return frame.sample<uint32_t>(x, y, channel) / 4294967295.0;
        case SampleType::Float32:
            return std::clamp(static_cast<double>(frame.sample<float>(x, y, channel)), 0.0, 1.0);
        case SampleType::Float64:
            return std::clamp(frame.sample<double>(x, y, channel), 0.0, 1.0);
        default:
            return 0.0;
    }
}

uint8_t toByte(double value) {
    return static_cast<uint8_t>(std::lround(std::clamp(value, 0.0, 1.0) * 255.0));
}

} // anonymous namespace

std::optional<Rgb> colorFromChar(char c) {
    static const char* kCodes = "kbgcrmyw";
    const char* pos = std::strchr(kCodes, c);
    if (c == '\0' || !pos) {
        return std::nullopt;
    }
    // Bit 2 is red, bit 1 green, bit 0 blue
    int index = static_cast<int>(pos - kCodes);
    return Rgb{static_cast<uint8_t>((index >> 2 & 1) * 255),
               static_cast<uint8_t>((index >> 1 & 1) * 255),
               static_cast<uint8_t>((index & 1) * 255)};
}

Result<std::optional<Rgb>, Error> parseBackground(const std::string& value) {
    if (value.empty() || value == "checkerboard") {
        return std::optional<Rgb>();
    }
    if (value.size() == 1) {
        if (auto color = colorFromChar(value[0])) {
            return color;
        }
    }
    return Error(ErrorCode::InvalidArgument, "Unknown background: " + value);
}

Result<Frame, Error> expandPalette(const Frame& indices, const std::vector<PaletteEntry>& palette) {
    if (!indices.isValid() || indices.channels() != 1 ||
        (indices.sampleType() != SampleType::UInt8 && indices.sampleType() != SampleType::UInt16)) {
        return Error(ErrorCode::InvalidArgument, "Palette indices must be a one channel integer frame");
    }

    auto created = Frame::create(indices.width(), indices.height(), 3, SampleType::UInt8);
    if (!created) {
        return created.error();
    }
    Frame rgb = std::move(created).value();

    const bool wide = indices.sampleType() == SampleType::UInt16;
    for (int y = 0; y < indices.height(); ++y) {
        for (int x = 0; x < indices.width(); ++x) {
            size_t index = wide ? indices.sample<uint16_t>(x, y, 0) : indices.sample<uint8_t>(x, y, 0);
            if (index >= palette.size()) {
                return Error(ErrorCode::InvalidData,
                    "Palette index " + std::to_string(index) + " outside palette of " +
                    std::to_string(palette.size()) + " colours");
            }
            const PaletteEntry& entry = palette[index];
            rgb.setSample<uint8_t>(x, y, 0, entry.r);
            rgb.setSample<uint8_t>(x, y, 1, entry.g);
            rgb.setSample<uint8_t>(x, y, 2, entry.b);
        }
    }
    return rgb;
}

Frame checkerboard(int width, int height) {
    auto created = Frame::create(std::max(width, 1), std::max(height, 1), 3, SampleType::UInt8);
    Frame board = std::move(created).value();

    const double longest = std::max(width, height);
    const int square = static_cast<int>(std::floor(
        std::max(std::log(longest / 100.0), 0.0) * 10.0 + 1.0 + std::min(longest, 100.0) / 20.0));

    for (int y = 0; y < board.height(); ++y) {
        for (int x = 0; x < board.width(); ++x) {
            uint8_t level = ((x / square + y / square) % 2) ? 171 : 85;
            for (int c = 0; c < 3; ++c) {
                board.setSample<uint8_t>(x, y, c, level);
            }
        }
    }
    return board;
}

Result<Frame, Error> toRgb8(const DecodedImage& image, const std::optional<Rgb>& background) {
    Frame source = image.pixels;
    if (image.isIndexed()) {
        auto expanded = expandPalette(image.pixels, image.palette);
        if (!expanded) {
            return expanded.error();
        }
        source = std::move(expanded).value();
    }

    if (!source.isValid()) {
        return Error(ErrorCode::InvalidArgument, "Empty image");
    }
    if (image.hasAlpha() &&
        (image.alpha.width() != source.width() || image.alpha.height() != source.height())) {
        return Error(ErrorCode::InvalidArgument, "Alpha plane size does not match image");
    }

    auto created = Frame::create(source.width(), source.height(), 3, SampleType::UInt8);
    if (!created) {
        return created.error();
    }
    Frame rgb = std::move(created).value();

    Frame board;
    if (image.hasAlpha() && !background) {
        board = checkerboard(source.width(), source.height());
    }

    const bool grey = source.channels() < 3;
    for (int y = 0; y < source.height(); ++y) {
        for (int x = 0; x < source.width(); ++x) {
            const double alpha = image.hasAlpha() ? normalizedSample(image.alpha, x, y, 0) : 1.0;
            for (int c = 0; c < 3; ++c) {
                double value = normalizedSample(source, x, y, grey ? 0 : c);
                if (alpha < 1.0) {
                    double back;
                    if (background) {
                        const uint8_t channel[3] = {background->r, background->g, background->b};
                        back = channel[c] / 255.0;
                    } else {
                        back = board.sample<uint8_t>(x, y, c) / 255.0;
                    }
                    value = value * alpha + back * (1.0 - alpha);
                }
                rgb.setSample<uint8_t>(x, y, c, toByte(value));
            }
        }
    }
    return rgb;
}

} // namespace reel::media
