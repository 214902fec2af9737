#include <reel/media/image_sequence.hpp>
#include <reel/core/logger.hpp>
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace reel::media {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

// ============================================================================
// SequencePattern
// ============================================================================

Result<SequencePattern, Error> SequencePattern::parse(const std::filesystem::path& file) {
    const std::string stem = file.stem().string();
    const std::string extension = file.extension().string();

    // Last maximal run of digits in the base name
    size_t end = stem.size();
    while (end > 0 && !isDigit(stem[end - 1])) {
        --end;
    }
    if (end == 0) {
        return Error(ErrorCode::SequenceNotDetected,
            "No image index found in file name " + file.filename().string());
    }
    size_t begin = end;
    while (begin > 0 && isDigit(stem[begin - 1])) {
        --begin;
    }

    const std::string digits = stem.substr(begin, end - begin);

    SequencePattern pattern;
    std::error_code ec;
    pattern.directory = file.has_parent_path()
        ? std::filesystem::absolute(file.parent_path(), ec)
        : std::filesystem::current_path(ec);
    if (ec) {
        pattern.directory = file.parent_path();
    }
    pattern.prefix = stem.substr(0, begin);
    pattern.suffix = stem.substr(end) + extension;
    pattern.padding = static_cast<int>(digits.size());
    try {
        pattern.firstNumber = std::stoll(digits);
    } catch (const std::out_of_range&) {
        return Error(ErrorCode::SequenceNotDetected, "Image index out of range: " + digits);
    }
    return pattern;
}

std::filesystem::path SequencePattern::pathFor(int64_t number) const {
    return directory / fmt::format("{}{:0{}d}{}", prefix, number, padding, suffix);
}

int64_t probeSequenceLength(const SequencePattern& pattern) {
    int64_t count = 0;
    while (true) {
        std::ifstream file(pattern.pathFor(pattern.firstNumber + count), std::ios::binary);
        if (!file.is_open()) {
            break;
        }
        ++count;
    }
    return count;
}

// ============================================================================
// ImageSequence
// ============================================================================

ImageSequence::ImageSequence(std::filesystem::path name, SequencePattern pattern,
                             std::shared_ptr<ImageReader> reader, const SequenceOptions& options,
                             int64_t frameCount)
    : m_name(std::move(name))
    , m_pattern(std::move(pattern))
    , m_reader(std::move(reader))
    , m_options(options)
    , m_frameCount(frameCount) {
}

ImageSequence::~ImageSequence() = default;

Result<std::unique_ptr<ImageSequence>, Error> ImageSequence::open(
    const std::filesystem::path& firstFrame,
    std::shared_ptr<ImageReader> reader,
    const SequenceOptions& options) {

    if (!reader) {
        return Error(ErrorCode::InvalidArgument, "No image reader given");
    }
    if (!options.frameRate.isValid()) {
        return Error(ErrorCode::InvalidArgument,
            fmt::format("Invalid sequence frame rate {}/{}", options.frameRate.num, options.frameRate.den));
    }

    auto parsed = SequencePattern::parse(firstFrame);
    if (!parsed) {
        return parsed.error();
    }
    SequencePattern pattern = std::move(parsed).value();

    const int64_t count = probeSequenceLength(pattern);
    if (count == 0) {
        return Error(ErrorCode::FileOpenFailed, "Cannot open " + firstFrame.string());
    }

    std::unique_ptr<ImageSequence> sequence(
        new ImageSequence(firstFrame, std::move(pattern), std::move(reader), options, count));

    // Frame properties are those of the first frame
    auto first = sequence->read(1);
    if (!first) {
        return first.error();
    }
    const Frame& frame = first.value();
    sequence->m_width = frame.width();
    sequence->m_height = frame.height();
    sequence->m_channels = frame.channels();
    sequence->m_bitsPerPixel = frame.bitsPerPixel();
    sequence->m_videoFormat = videoFormatName(frame);

    REEL_LOG_DEBUG("Image sequence {}: {} frames of {}x{} {}", firstFrame.string(), count,
                   sequence->m_width, sequence->m_height, sequence->m_videoFormat);
    return std::move(sequence);
}

std::filesystem::path ImageSequence::framePath(int64_t frameIndex) const {
    return m_pattern.pathFor(m_pattern.firstNumber + frameIndex - 1);
}

Result<Frame, Error> ImageSequence::read(int64_t frameIndex) {
    if (frameIndex < 1 || frameIndex > m_frameCount) {
        return Error(ErrorCode::OutOfRange,
            fmt::format("Frame {} is not in the range of allowed frames: [1 {}]", frameIndex, m_frameCount));
    }

    auto decoded = m_reader->read(framePath(frameIndex));
    if (!decoded) {
        return decoded.error();
    }
    const DecodedImage& image = decoded.value();

    if (m_options.normalizeToRgb8) {
        return toRgb8(image, m_options.background);
    }
    if (image.isIndexed()) {
        return expandPalette(image.pixels, image.palette);
    }
    return image.pixels;
}

Duration ImageSequence::duration() const {
    return frameToTimestamp(m_frameCount, m_options.frameRate);
}

Timestamp ImageSequence::currentTime() const {
    return frameToTimestamp(m_cursor, m_options.frameRate);
}

Result<void, Error> ImageSequence::setCurrentTime(Timestamp time) {
    const int64_t frame = timestampToFrame(time, m_options.frameRate);
    if (time < 0 || frame > m_frameCount) {
        return Error(ErrorCode::OutOfRange,
            fmt::format("Time {}us is outside the sequence of {} frames", time, m_frameCount));
    }
    m_cursor = frame;
    return Ok();
}

Result<Frame, Error> ImageSequence::readNextFrame() {
    if (m_cursor >= m_frameCount) {
        return Error(ErrorCode::EndOfFile, "No frames remaining in " + m_name.string());
    }
    auto frame = read(m_cursor + 1);
    if (frame) {
        ++m_cursor;
    }
    return frame;
}

bool ImageSequence::hasFrameRemaining() const {
    return m_cursor < m_frameCount;
}

SourceInfo ImageSequence::info() const {
    SourceInfo info;
    info.name = m_name.string();
    info.type = "imseq";
    info.videoFormat = m_videoFormat;
    info.width = m_width;
    info.height = m_height;
    info.bitsPerPixel = m_bitsPerPixel;
    info.frameRate = m_options.frameRate;
    info.duration = duration();
    info.frameCount = m_frameCount;
    return info;
}

} // namespace reel::media
