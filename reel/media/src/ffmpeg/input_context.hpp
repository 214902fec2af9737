/**
 * @file input_context.hpp
 * @brief Demuxer plus video decoder for one file
 *
 * Shared by the video decoder and the single image reader; FFmpeg's
 * image2 demuxer makes still images look like one-frame videos.
 */

#pragma once

#include "ff_common.hpp"
#include "shared_avframe.hpp"
#include <filesystem>

namespace reel::media::ff {

class InputContext {
public:
    InputContext();
    ~InputContext();

    InputContext(const InputContext&) = delete;
    InputContext& operator=(const InputContext&) = delete;

    /**
     * @brief Open a file and the decoder of its best video stream
     *
     * @param threadCount Decoder threads, 0 = auto
     */
    Result<void, Error> open(const std::filesystem::path& path, int threadCount = 0);

    void close();

    [[nodiscard]] bool isOpen() const { return m_formatCtx != nullptr; }

    /**
     * @brief Decode the next picture of the video stream
     *
     * @return A frame referencing the decoded picture, or EndOfFile once
     *         the decoder has been drained
     */
    Result<SharedAVFrame, Error> decodeNext();

    /**
     * @brief Seek to the keyframe at or before a stream timestamp
     *
     * Flushes the decoder. Decoding then resumes at that keyframe.
     */
    Result<void, Error> seek(int64_t streamTimestamp);

    AVFormatContext* format() const { return m_formatCtx; }
    AVCodecContext* codec() const { return m_codecCtx; }
    AVStream* stream() const {
        return m_formatCtx && m_streamIdx >= 0 ? m_formatCtx->streams[m_streamIdx] : nullptr;
    }

private:
    AVFormatContext* m_formatCtx = nullptr;
    AVCodecContext* m_codecCtx = nullptr;
    int m_streamIdx = -1;

    SharedAVPacket m_packet;
    SharedAVFrame m_decodedFrame;
    bool m_draining = false;
};

} // namespace reel::media::ff
