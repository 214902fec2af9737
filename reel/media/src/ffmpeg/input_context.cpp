#include "input_context.hpp"

namespace reel::media::ff {

InputContext::InputContext()
    : m_packet(SharedAVPacket::alloc())
    , m_decodedFrame(SharedAVFrame::alloc())
{}

InputContext::~InputContext() {
    close();
}

void InputContext::close() {
    if (m_codecCtx) {
        avcodec_free_context(&m_codecCtx);
    }
    if (m_formatCtx) {
        avformat_close_input(&m_formatCtx);
    }
    m_streamIdx = -1;
    m_draining = false;
}

Result<void, Error> InputContext::open(const std::filesystem::path& path, int threadCount) {
    close();

    if (!m_packet || !m_decodedFrame) {
        return Error(ErrorCode::OutOfMemory, "Failed to allocate packet or frame");
    }

    int ret = avformat_open_input(&m_formatCtx, path.string().c_str(), nullptr, nullptr);
    if (ret < 0) {
        return avError(ret, "Failed to open " + path.string(), ErrorCode::FileOpenFailed);
    }

    ret = avformat_find_stream_info(m_formatCtx, nullptr);
    if (ret < 0) {
        close();
        return avError(ret, "Failed to find stream info", ErrorCode::ReadError);
    }

    m_streamIdx = av_find_best_stream(m_formatCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (m_streamIdx < 0) {
        close();
        return Error(ErrorCode::NotFound, "No video stream in " + path.string());
    }

    AVCodecParameters* codecpar = m_formatCtx->streams[m_streamIdx]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
    if (!codec) {
        close();
        return Error(ErrorCode::CodecNotFound, "Decoder not found");
    }

    m_codecCtx = avcodec_alloc_context3(codec);
    if (!m_codecCtx) {
        close();
        return Error(ErrorCode::OutOfMemory, "Failed to allocate codec context");
    }

    ret = avcodec_parameters_to_context(m_codecCtx, codecpar);
    if (ret < 0) {
        close();
        return avError(ret, "Failed to copy codec parameters");
    }

    m_codecCtx->thread_count = threadCount > 0 ? threadCount : 0;
    m_codecCtx->thread_type = FF_THREAD_FRAME | FF_THREAD_SLICE;

    ret = avcodec_open2(m_codecCtx, codec, nullptr);
    if (ret < 0) {
        close();
        return avError(ret, "Failed to open codec");
    }

    return Ok();
}

Result<SharedAVFrame, Error> InputContext::decodeNext() {
    if (!m_codecCtx) {
        return Error(ErrorCode::InvalidArgument, "Input not open");
    }

    while (true) {
        m_decodedFrame.unref();
        int ret = avcodec_receive_frame(m_codecCtx, m_decodedFrame.get());

        if (ret == 0) {
            SharedAVFrame frame = m_decodedFrame.ref();
            if (!frame) {
                return Error(ErrorCode::OutOfMemory, "Failed to reference frame");
            }
            return frame;
        }

        if (ret == AVERROR_EOF) {
            return Error(ErrorCode::EndOfFile, "End of video stream");
        }

        if (ret != AVERROR(EAGAIN)) {
            return avError(ret, "Decode error");
        }

        if (m_draining) {
            return Error(ErrorCode::EndOfFile, "End of video stream");
        }

        // Need more data - read packet
        m_packet.unref();
        ret = av_read_frame(m_formatCtx, m_packet.get());

        if (ret == AVERROR_EOF) {
            // Flush decoder
            ret = avcodec_send_packet(m_codecCtx, nullptr);
            if (ret < 0 && ret != AVERROR_EOF) {
                return avError(ret, "Failed to flush decoder");
            }
            m_draining = true;
            continue;
        }

        if (ret < 0) {
            return avError(ret, "Failed to read packet", ErrorCode::ReadError);
        }

        if (m_packet->stream_index != m_streamIdx) {
            continue;
        }

        ret = avcodec_send_packet(m_codecCtx, m_packet.get());
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            return avError(ret, "Failed to send packet");
        }
    }
}

Result<void, Error> InputContext::seek(int64_t streamTimestamp) {
    if (!m_formatCtx || !m_codecCtx) {
        return Error(ErrorCode::InvalidArgument, "Input not open");
    }

    int ret = av_seek_frame(m_formatCtx, m_streamIdx, streamTimestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        return avError(ret, "Seek failed", ErrorCode::ReadError);
    }

    avcodec_flush_buffers(m_codecCtx);
    m_draining = false;
    return Ok();
}

} // namespace reel::media::ff
