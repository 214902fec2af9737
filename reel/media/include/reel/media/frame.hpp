/**
 * @file frame.hpp
 * @brief Decoded picture buffer
 *
 * A Frame is a packed, interleaved pixel buffer (height x width x channels)
 * of one of a few sample types. Copies share the same pixel data, so frames
 * are cheap to pass around, cache and return by value.
 */

#pragma once

#include <reel/core/types.hpp>
#include <reel/core/result.hpp>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <string>

namespace reel::media {

/**
 * @brief Per-channel sample type
 */
enum class SampleType {
    UInt8,
    UInt16,
    UInt32,
    Float32,
    Float64,
};

/// Size of one sample in bytes
inline int bytesPerSample(SampleType type) {
    switch (type) {
        case SampleType::UInt8: return 1;
        case SampleType::UInt16: return 2;
        case SampleType::UInt32: return 4;
        case SampleType::Float32: return 4;
        case SampleType::Float64: return 8;
        default: return 0;
    }
}

/**
 * @brief Owned pixel buffer
 *
 * Row-major, tightly packed, channels interleaved. A default constructed
 * frame is empty (isValid() is false).
 */
class Frame {
public:
    Frame();
    ~Frame();

    // Copy shares pixel data
    Frame(const Frame& other);
    Frame& operator=(const Frame& other);
    Frame(Frame&& other) noexcept;
    Frame& operator=(Frame&& other) noexcept;

    // ========== Properties ==========

    [[nodiscard]] int width() const;
    [[nodiscard]] int height() const;
    [[nodiscard]] int channels() const;
    [[nodiscard]] SampleType sampleType() const;

    /// Bits of one sample
    [[nodiscard]] int bitsPerSample() const;

    /// Bits of one pixel (all channels)
    [[nodiscard]] int bitsPerPixel() const;

    /// Bytes of one row
    [[nodiscard]] size_t stride() const;

    /// Total size of the pixel data in bytes
    [[nodiscard]] size_t byteSize() const;

    // ========== Data Access ==========

    [[nodiscard]] const uint8_t* data() const;
    [[nodiscard]] uint8_t* data();

    /// Pointer to the first sample of a row
    [[nodiscard]] const uint8_t* row(int y) const;
    [[nodiscard]] uint8_t* row(int y);

    /**
     * @brief Typed sample access (no bounds checking)
     *
     * T must match sampleType().
     */
    template<typename T>
    [[nodiscard]] T sample(int x, int y, int channel) const {
        return reinterpret_cast<const T*>(row(y))[static_cast<size_t>(x) * channels() + channel];
    }

    template<typename T>
    void setSample(int x, int y, int channel, T value) {
        reinterpret_cast<T*>(row(y))[static_cast<size_t>(x) * channels() + channel] = value;
    }

    /// True if both frames have the same layout and identical bytes
    [[nodiscard]] bool sameContent(const Frame& other) const;

    /// Deep copy with its own pixel data
    [[nodiscard]] Frame clone() const;

    // ========== Validity ==========

    [[nodiscard]] bool isValid() const;
    explicit operator bool() const { return isValid(); }

    // ========== Factory ==========

    /**
     * @brief Allocate a zero-filled frame
     *
     * @return Allocated frame, or InvalidArgument for a non-positive size
     */
    static Result<Frame, Error> create(int width, int height, int channels,
                                       SampleType type = SampleType::UInt8);

private:
    struct Impl;
    std::shared_ptr<Impl> m_impl;
};

/**
 * @brief VideoReader style format name, e.g. "Gray8", "RGB24", "RGB48"
 */
std::string videoFormatName(const Frame& frame);

} // namespace reel::media
