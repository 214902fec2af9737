/**
 * @file frame.cpp
 * @brief Frame implementation
 */

#include <reel/media/frame.hpp>
#include <cstring>
#include <vector>

namespace reel::media {

struct Frame::Impl {
    int width = 0;
    int height = 0;
    int channels = 0;
    SampleType type = SampleType::UInt8;
    std::vector<uint8_t> pixels;
};

Frame::Frame() = default;
Frame::~Frame() = default;

Frame::Frame(const Frame& other) = default;
Frame& Frame::operator=(const Frame& other) = default;
Frame::Frame(Frame&& other) noexcept = default;
Frame& Frame::operator=(Frame&& other) noexcept = default;

int Frame::width() const {
    return m_impl ? m_impl->width : 0;
}

int Frame::height() const {
    return m_impl ? m_impl->height : 0;
}

int Frame::channels() const {
    return m_impl ? m_impl->channels : 0;
}

SampleType Frame::sampleType() const {
    return m_impl ? m_impl->type : SampleType::UInt8;
}

int Frame::bitsPerSample() const {
    return m_impl ? bytesPerSample(m_impl->type) * 8 : 0;
}

int Frame::bitsPerPixel() const {
    return bitsPerSample() * channels();
}

size_t Frame::stride() const {
    if (!m_impl) return 0;
    return static_cast<size_t>(m_impl->width) * m_impl->channels * bytesPerSample(m_impl->type);
}

size_t Frame::byteSize() const {
    return m_impl ? m_impl->pixels.size() : 0;
}

const uint8_t* Frame::data() const {
    return m_impl ? m_impl->pixels.data() : nullptr;
}

uint8_t* Frame::data() {
    return m_impl ? m_impl->pixels.data() : nullptr;
}

const uint8_t* Frame::row(int y) const {
    if (!m_impl || y < 0 || y >= m_impl->height) return nullptr;
    return m_impl->pixels.data() + stride() * static_cast<size_t>(y);
}

uint8_t* Frame::row(int y) {
    if (!m_impl || y < 0 || y >= m_impl->height) return nullptr;
    return m_impl->pixels.data() + stride() * static_cast<size_t>(y);
}

bool Frame::sameContent(const Frame& other) const {
    if (!isValid() || !other.isValid()) {
        return isValid() == other.isValid();
    }
    if (m_impl == other.m_impl) return true;
    return width() == other.width() && height() == other.height() &&
           channels() == other.channels() && sampleType() == other.sampleType() &&
           std::memcmp(data(), other.data(), byteSize()) == 0;
}

Frame Frame::clone() const {
    Frame copy;
    if (m_impl) {
        copy.m_impl = std::make_shared<Impl>(*m_impl);
    }
    return copy;
}

bool Frame::isValid() const {
    return m_impl && m_impl->width > 0 && m_impl->height > 0 && m_impl->channels > 0;
}

Result<Frame, Error> Frame::create(int width, int height, int channels, SampleType type) {
    if (width <= 0 || height <= 0 || channels <= 0) {
        return Error(ErrorCode::InvalidArgument, "Invalid dimensions");
    }

    Frame frame;
    frame.m_impl = std::make_shared<Impl>();
    frame.m_impl->width = width;
    frame.m_impl->height = height;
    frame.m_impl->channels = channels;
    frame.m_impl->type = type;
    frame.m_impl->pixels.assign(frame.stride() * static_cast<size_t>(height), 0);
    return frame;
}

std::string videoFormatName(const Frame& frame) {
    const int bpp = frame.bitsPerPixel();
    switch (frame.channels()) {
        case 1: return "Gray" + std::to_string(bpp);
        case 2: return std::to_string(bpp);
        case 3: return "RGB" + std::to_string(bpp);
        case 4: return "CMYK" + std::to_string(bpp);
        default: return std::to_string(bpp);
    }
}

} // namespace reel::media
