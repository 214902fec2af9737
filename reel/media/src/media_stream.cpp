/**
 * @file media_stream.cpp
 * @brief MediaStream implementation
 */

#include <reel/media/media_stream.hpp>
#include <reel/media/image_sequence.hpp>
#include <reel/media/media_formats.hpp>
#include <reel/media/video_decoder.hpp>
#include <reel/core/logger.hpp>
#include <reel/core/lru_cache.hpp>
#include <algorithm>
#include <mutex>

namespace reel::media {

// ============================================================================
// StreamOptions
// ============================================================================

Result<StreamOptions, Error> StreamOptions::fromConfig(const Config& config) {
    StreamOptions options;

    int capacity = config.get<int>("stream.cacheCapacity", DefaultConfig::kCacheCapacity);
    options.cacheCapacity = static_cast<size_t>(std::max(capacity, 1));

    int rate = config.get<int>("sequence.frameRate", DefaultConfig::kSequenceFrameRate);
    if (rate <= 0) {
        return Error(ErrorCode::InvalidArgument,
            "sequence.frameRate must be positive, got " + std::to_string(rate));
    }
    options.sequenceFrameRate = {rate, 1};

    auto background = parseBackground(
        config.get<std::string>("image.background", DefaultConfig::kBackground));
    if (!background) {
        return background.error();
    }
    options.background = background.value();
    options.normalizeRgb = config.get<bool>("image.normalize", DefaultConfig::kNormalizeImages);
    options.decoderThreads = config.get<int>("video.threads", DefaultConfig::kDecoderThreads);
    return options;
}

// ============================================================================
// MediaStream Implementation
// ============================================================================

struct MediaStream::Impl {
    mutable std::mutex mutex;
    std::string name;
    std::unique_ptr<FrameSource> source;
    LRUCache<int64_t, Frame> cache;

    int64_t frameCount = 0;

    // Index of the last frame returned by read(), 0 before the first read
    int64_t currentFrame = 0;

    // Index of the frame the backend produced last; -1 when unknown
    int64_t lastDecodedFrame = 0;

    uint64_t repositions = 0;
    uint64_t framesDecoded = 0;

    Impl(std::unique_ptr<FrameSource> src, size_t cacheCapacity, std::string streamName)
        : name(std::move(streamName))
        , source(std::move(src))
        , cache([this](const int64_t& index) { return decode(index); }, cacheCapacity)
        , frameCount(source ? source->frameCount() : 0)
    {}

    /// Low-level read, called by the cache on a miss
    Result<Frame, Error> decode(int64_t index) {
        if (index != lastDecodedFrame + 1) {
            Timestamp target = frameToTimestamp(index - 1, source->frameRate());
            REEL_LOG_DEBUG("{}: repositioning to frame {} ({}us)", name, index, target);
            ++repositions;
            auto moved = source->setCurrentTime(target);
            if (!moved) {
                lastDecodedFrame = -1;
                return moved.error();
            }
        }

        auto frame = source->readNextFrame();
        if (!frame) {
            lastDecodedFrame = -1;
            return frame.error();
        }
        lastDecodedFrame = index;
        ++framesDecoded;
        return frame;
    }

    Result<Frame, Error> read(int64_t index) {
        if (!source) {
            return Error(ErrorCode::StreamClosed, "Stream " + name + " is closed");
        }
        if (index == kLastFrame) {
            index = frameCount;
        }
        if (index < 1 || index > frameCount) {
            return Error(ErrorCode::OutOfRange,
                "Frame " + std::to_string(index) + " is not in the range of allowed frames: [1 " +
                std::to_string(frameCount) + "]");
        }

        auto frame = cache.get(index);
        if (!frame) {
            REEL_LOG_WARN("{}: failed to read frame {}: {}", name, index, frame.error().what());
            return frame.error();
        }
        currentFrame = index;
        return frame;
    }

    void close() {
        if (!source) {
            return;
        }
        source.reset();
        cache.clear();
        REEL_LOG_INFO("Closed {}", name);
    }
};

// ============================================================================
// MediaStream Public Interface
// ============================================================================

MediaStream::MediaStream(std::unique_ptr<FrameSource> source, size_t cacheCapacity, std::string name)
    : m_impl(std::make_unique<Impl>(std::move(source), cacheCapacity, std::move(name))) {}

MediaStream::~MediaStream() {
    close();
}

MediaStream::MediaStream(MediaStream&& other) noexcept = default;

MediaStream& MediaStream::operator=(MediaStream&& other) noexcept {
    if (this != &other) {
        close();
        m_impl = std::move(other.m_impl);
    }
    return *this;
}

Result<MediaStream, Error> MediaStream::open(const std::filesystem::path& path,
                                             const StreamOptions& options) {
    std::unique_ptr<FrameSource> source;

    switch (detectStreamKind(path)) {
        case StreamKind::ImageSequence: {
            SequenceOptions sequenceOptions;
            sequenceOptions.frameRate = options.sequenceFrameRate;
            sequenceOptions.normalizeToRgb8 = options.normalizeRgb;
            sequenceOptions.background = options.background;

            auto reader = options.imageReader ? options.imageReader : createImageReader();
            auto sequence = ImageSequence::open(path, std::move(reader), sequenceOptions);
            if (!sequence) {
                REEL_LOG_ERROR("Failed to open image sequence {}: {}", path.string(),
                               sequence.error().what());
                return sequence.error();
            }
            source = std::move(sequence).value();
            break;
        }
        case StreamKind::Video: {
            VideoDecoderConfig config;
            config.path = path;
            config.threadCount = options.decoderThreads;

            auto decoder = VideoDecoder::open(config);
            if (!decoder) {
                REEL_LOG_ERROR("Failed to open video {}: {}", path.string(), decoder.error().what());
                return decoder.error();
            }
            source = std::move(decoder).value();
            break;
        }
        default:
            return Error(ErrorCode::UnsupportedFormat,
                "File extension " + path.extension().string() + " not recognised.");
    }

    MediaStream stream(std::move(source), options.cacheCapacity, path.string());
    REEL_LOG_INFO("Opened {}: {} frames, cache of {}", path.string(), stream.numFrames(),
                  std::max<size_t>(options.cacheCapacity, 1));
    return std::move(stream);
}

void MediaStream::close() {
    if (!m_impl) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    m_impl->close();
}

bool MediaStream::isOpen() const {
    if (!m_impl) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->source != nullptr;
}

Result<Frame, Error> MediaStream::read(int64_t frameIndex) {
    if (!m_impl) {
        return Error(ErrorCode::StreamClosed, "Stream has been moved from");
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->read(frameIndex);
}

int64_t MediaStream::numFrames() const {
    return m_impl ? m_impl->frameCount : 0;
}

int64_t MediaStream::currentFrame() const {
    if (!m_impl) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->currentFrame;
}

bool MediaStream::hasFrameRemaining() const {
    if (!m_impl) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->source && m_impl->currentFrame < m_impl->frameCount;
}

Result<Frame, Error> MediaStream::readNextFrame() {
    if (!m_impl) {
        return Error(ErrorCode::StreamClosed, "Stream has been moved from");
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    if (m_impl->source && m_impl->currentFrame >= m_impl->frameCount) {
        return Error(ErrorCode::EndOfStream, "No frames remaining in " + m_impl->name);
    }
    return m_impl->read(m_impl->currentFrame + 1);
}

Result<bool, Error> MediaStream::seek(int64_t frameIndex) {
    auto frame = read(frameIndex);
    if (!frame) {
        return frame.error();
    }
    return frame.value().isValid();
}

Result<bool, Error> MediaStream::step(int64_t delta) {
    auto frame = readRelative(delta);
    if (!frame) {
        return frame.error();
    }
    return frame.value().isValid();
}

Result<bool, Error> MediaStream::next() {
    return step(1);
}

Result<Frame, Error> MediaStream::currentFrameData() {
    return readRelative(0);
}

Result<Frame, Error> MediaStream::nextFrame() {
    return readRelative(1);
}

Result<Frame, Error> MediaStream::readRelative(int64_t delta) {
    if (!m_impl) {
        return Error(ErrorCode::StreamClosed, "Stream has been moved from");
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->read(m_impl->currentFrame + delta);
}

Result<SourceInfo, Error> MediaStream::info() const {
    if (!m_impl) {
        return Error(ErrorCode::StreamClosed, "Stream has been moved from");
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    if (!m_impl->source) {
        return Error(ErrorCode::StreamClosed, "Stream " + m_impl->name + " is closed");
    }
    SourceInfo info = m_impl->source->info();
    if (!m_impl->name.empty()) {
        info.name = m_impl->name;
    }
    return info;
}

StreamStats MediaStream::stats() const {
    StreamStats stats;
    if (!m_impl) {
        return stats;
    }
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    auto cacheStats = m_impl->cache.stats();
    stats.cacheHits = cacheStats.hits;
    stats.cacheMisses = cacheStats.misses;
    stats.repositions = m_impl->repositions;
    stats.framesDecoded = m_impl->framesDecoded;
    return stats;
}

const std::string& MediaStream::name() const {
    static const std::string kEmpty;
    return m_impl ? m_impl->name : kEmpty;
}

} // namespace reel::media
