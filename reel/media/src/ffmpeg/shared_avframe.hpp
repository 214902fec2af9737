/**
 * @file shared_avframe.hpp
 * @brief RAII wrappers for AVFrame and AVPacket
 */

#pragma once

#include "ff_common.hpp"
#include <memory>

namespace reel::media::ff {

struct AVFrameDeleter {
    void operator()(AVFrame* frame) const {
        if (frame) {
            av_frame_free(&frame);
        }
    }
};

/**
 * @brief Reference counted AVFrame handle
 */
class SharedAVFrame {
public:
    SharedAVFrame() = default;

    /// Create and allocate a new frame
    static SharedAVFrame alloc() {
        SharedAVFrame frame;
        frame.m_frame.reset(av_frame_alloc(), AVFrameDeleter{});
        return frame;
    }

    /// Create a new frame referencing this frame's buffers
    SharedAVFrame ref() const {
        if (!m_frame) return {};

        SharedAVFrame copy = alloc();
        if (!copy || av_frame_ref(copy.m_frame.get(), m_frame.get()) < 0) {
            return {};
        }
        return copy;
    }

    AVFrame* get() const { return m_frame.get(); }
    AVFrame* operator->() const { return m_frame.get(); }
    AVFrame& operator*() const { return *m_frame; }
    explicit operator bool() const { return m_frame != nullptr; }

    /// Unreference the frame data (keep allocation)
    void unref() {
        if (m_frame) {
            av_frame_unref(m_frame.get());
        }
    }

private:
    std::shared_ptr<AVFrame> m_frame;
};

struct AVPacketDeleter {
    void operator()(AVPacket* pkt) const {
        if (pkt) {
            av_packet_free(&pkt);
        }
    }
};

/**
 * @brief RAII wrapper for AVPacket
 */
class SharedAVPacket {
public:
    SharedAVPacket() = default;

    static SharedAVPacket alloc() {
        SharedAVPacket pkt;
        pkt.m_packet.reset(av_packet_alloc(), AVPacketDeleter{});
        return pkt;
    }

    AVPacket* get() const { return m_packet.get(); }
    AVPacket* operator->() const { return m_packet.get(); }
    explicit operator bool() const { return m_packet != nullptr; }

    void unref() {
        if (m_packet) {
            av_packet_unref(m_packet.get());
        }
    }

private:
    std::shared_ptr<AVPacket> m_packet;
};

/**
 * @brief Deleter for SwsContext
 */
struct SwsContextDeleter {
    void operator()(SwsContext* ctx) const {
        sws_freeContext(ctx);
    }
};

using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;

} // namespace reel::media::ff
