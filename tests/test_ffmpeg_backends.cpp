// Exercises the FFmpeg backed reader and decoder on files written by the test
// itself (binary PNM, and an MJPEG clip encoded with libavcodec), so no media
// fixtures are needed.

#include <gtest/gtest.h>
#include <reel/media/image_reader.hpp>
#include <reel/media/media_stream.hpp>
#include <reel/media/video_decoder.hpp>
#include "test_helpers.hpp"
#include "ffmpeg/shared_avframe.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>

namespace reel::test {

namespace {

/// Binary PPM where pixel (x, y) is (base + x, base + y, base)
void writePpm(const std::filesystem::path& path, int width, int height, int base) {
    std::ofstream out(path, std::ios::binary);
    out << "P6\n" << width << " " << height << "\n255\n";
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            out.put(static_cast<char>(base + x));
            out.put(static_cast<char>(base + y));
            out.put(static_cast<char>(base));
        }
    }
}

/// 16 bit binary PGM filled with one value (big endian on disk)
void writePgm16(const std::filesystem::path& path, int width, int height, uint16_t value) {
    std::ofstream out(path, std::ios::binary);
    out << "P5\n" << width << " " << height << "\n65535\n";
    for (int i = 0; i < width * height; ++i) {
        out.put(static_cast<char>(value >> 8));
        out.put(static_cast<char>(value & 0xFF));
    }
}

constexpr int kClipFrames = 10;
constexpr int kClipWidth = 64;
constexpr int kClipHeight = 48;

/// Grey level of zero-based clip frame k
uint8_t clipLevel(int64_t k) {
    return static_cast<uint8_t>(40 + 16 * k);
}

struct OutputContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (ctx->pb) {
            avio_closep(&ctx->pb);
        }
        avformat_free_context(ctx);
    }
};

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const {
        avcodec_free_context(&ctx);
    }
};

/// MJPEG AVI at 25 fps where frame k is solid grey clipLevel(k)
::testing::AssertionResult writeClip(const std::filesystem::path& path) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
    if (!codec) {
        return ::testing::AssertionFailure() << "MJPEG encoder not available";
    }

    AVFormatContext* rawFormat = nullptr;
    int ret = avformat_alloc_output_context2(&rawFormat, nullptr, "avi", path.string().c_str());
    if (ret < 0 || !rawFormat) {
        return ::testing::AssertionFailure() << "avi muxer: " << media::ff::avErrorString(ret);
    }
    std::unique_ptr<AVFormatContext, OutputContextDeleter> format(rawFormat);

    AVStream* stream = avformat_new_stream(format.get(), nullptr);
    std::unique_ptr<AVCodecContext, CodecContextDeleter> encoder(avcodec_alloc_context3(codec));
    if (!stream || !encoder) {
        return ::testing::AssertionFailure() << "allocation failed";
    }

    encoder->width = kClipWidth;
    encoder->height = kClipHeight;
    encoder->pix_fmt = AV_PIX_FMT_YUVJ420P;
    encoder->color_range = AVCOL_RANGE_JPEG;
    encoder->time_base = {1, 25};
    encoder->framerate = {25, 1};
    if (format->oformat->flags & AVFMT_GLOBALHEADER) {
        encoder->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    if ((ret = avcodec_open2(encoder.get(), codec, nullptr)) < 0 ||
        (ret = avcodec_parameters_from_context(stream->codecpar, encoder.get())) < 0) {
        return ::testing::AssertionFailure() << "encoder: " << media::ff::avErrorString(ret);
    }
    stream->time_base = encoder->time_base;

    if ((ret = avio_open(&format->pb, path.string().c_str(), AVIO_FLAG_WRITE)) < 0 ||
        (ret = avformat_write_header(format.get(), nullptr)) < 0) {
        return ::testing::AssertionFailure() << "header: " << media::ff::avErrorString(ret);
    }

    auto picture = media::ff::SharedAVFrame::alloc();
    auto packet = media::ff::SharedAVPacket::alloc();
    picture->format = encoder->pix_fmt;
    picture->width = kClipWidth;
    picture->height = kClipHeight;
    if (!packet || av_frame_get_buffer(picture.get(), 0) < 0) {
        return ::testing::AssertionFailure() << "picture allocation failed";
    }

    auto writePackets = [&]() {
        int received;
        while ((received = avcodec_receive_packet(encoder.get(), packet.get())) == 0) {
            av_packet_rescale_ts(packet.get(), encoder->time_base, stream->time_base);
            packet->stream_index = stream->index;
            int written = av_interleaved_write_frame(format.get(), packet.get());
            if (written < 0) {
                return written;
            }
        }
        return (received == AVERROR(EAGAIN) || received == AVERROR_EOF) ? 0 : received;
    };

    for (int k = 0; k < kClipFrames; ++k) {
        if ((ret = av_frame_make_writable(picture.get())) < 0) {
            return ::testing::AssertionFailure() << "frame: " << media::ff::avErrorString(ret);
        }
        for (int y = 0; y < kClipHeight; ++y) {
            std::memset(picture->data[0] + y * picture->linesize[0], clipLevel(k), kClipWidth);
        }
        for (int y = 0; y < kClipHeight / 2; ++y) {
            std::memset(picture->data[1] + y * picture->linesize[1], 128, kClipWidth / 2);
            std::memset(picture->data[2] + y * picture->linesize[2], 128, kClipWidth / 2);
        }
        picture->pts = k;

        if ((ret = avcodec_send_frame(encoder.get(), picture.get())) < 0 || (ret = writePackets()) < 0) {
            return ::testing::AssertionFailure() << "encode: " << media::ff::avErrorString(ret);
        }
    }

    if ((ret = avcodec_send_frame(encoder.get(), nullptr)) < 0 || (ret = writePackets()) < 0 ||
        (ret = av_write_trailer(format.get())) < 0) {
        return ::testing::AssertionFailure() << "flush: " << media::ff::avErrorString(ret);
    }
    return ::testing::AssertionSuccess();
}

/// True when every pixel of an RGB24 frame is within a few levels of grey value
::testing::AssertionResult isGrey(const media::Frame& frame, uint8_t value) {
    for (int y = 0; y < frame.height(); ++y) {
        for (int x = 0; x < frame.width(); ++x) {
            for (int c = 0; c < 3; ++c) {
                int sample = frame.sample<uint8_t>(x, y, c);
                if (std::abs(sample - value) > 6) {
                    return ::testing::AssertionFailure()
                        << "pixel (" << x << ", " << y << ") channel " << c << " is " << sample
                        << ", expected " << static_cast<int>(value);
                }
            }
        }
    }
    return ::testing::AssertionSuccess();
}

} // anonymous namespace

class FFmpegBackendTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(FFmpegBackendTest, ReadsRgbImage) {
    auto file = dir.path() / "rgb.ppm";
    writePpm(file, 4, 3, 100);

    auto reader = media::createImageReader();
    auto image = reader->read(file);
    ASSERT_TRUE(image.ok()) << image.error().what();

    const media::Frame& pixels = image.value().pixels;
    EXPECT_FALSE(image.value().isIndexed());
    EXPECT_FALSE(image.value().hasAlpha());
    EXPECT_EQ(pixels.width(), 4);
    EXPECT_EQ(pixels.height(), 3);
    EXPECT_EQ(pixels.channels(), 3);
    EXPECT_EQ(pixels.sampleType(), media::SampleType::UInt8);
    EXPECT_EQ(pixels.sample<uint8_t>(3, 2, 0), 103);
    EXPECT_EQ(pixels.sample<uint8_t>(3, 2, 1), 102);
    EXPECT_EQ(pixels.sample<uint8_t>(3, 2, 2), 100);
}

TEST_F(FFmpegBackendTest, KeepsSixteenBitGrey) {
    auto file = dir.path() / "deep.pgm";
    writePgm16(file, 2, 2, 0x1234);

    auto image = media::createImageReader()->read(file);
    ASSERT_TRUE(image.ok()) << image.error().what();

    const media::Frame& pixels = image.value().pixels;
    EXPECT_EQ(pixels.channels(), 1);
    EXPECT_EQ(pixels.sampleType(), media::SampleType::UInt16);
    EXPECT_EQ(pixels.sample<uint16_t>(1, 1, 0), 0x1234);
    EXPECT_EQ(media::videoFormatName(pixels), "Gray16");
}

TEST_F(FFmpegBackendTest, MissingImageIsIoError) {
    auto image = media::createImageReader()->read(dir.path() / "missing.png");
    ASSERT_FALSE(image.ok());
    EXPECT_TRUE(isIoError(image.error().code()));
}

TEST_F(FFmpegBackendTest, StreamsPpmSequence) {
    for (int i = 1; i <= 3; ++i) {
        writePpm(dir.path() / ("seq." + std::to_string(i) + ".ppm"), 5, 4, 10 * i);
    }

    auto opened = media::MediaStream::open(dir.path() / "seq.1.ppm");
    ASSERT_TRUE(opened.ok()) << opened.error().what();
    media::MediaStream stream = std::move(opened).value();
    EXPECT_EQ(stream.numFrames(), 3);

    auto info = stream.info();
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info.value().videoFormat, "RGB24");
    EXPECT_EQ(info.value().width, 5);
    EXPECT_EQ(info.value().height, 4);

    auto second = stream.read(2);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().sample<uint8_t>(0, 0, 2), 20);

    auto third = stream.readNextFrame();
    ASSERT_TRUE(third.ok());
    EXPECT_EQ(third.value().sample<uint8_t>(0, 0, 2), 30);
    EXPECT_FALSE(stream.hasFrameRemaining());
}

TEST_F(FFmpegBackendTest, MissingVideoIsIoError) {
    media::VideoDecoderConfig config;
    config.path = dir.path() / "missing.mp4";

    auto decoder = media::VideoDecoder::open(config);
    ASSERT_FALSE(decoder.ok());
    EXPECT_TRUE(isIoError(decoder.error().code()));
}

TEST_F(FFmpegBackendTest, GarbageVideoFailsToOpen) {
    auto file = dir.touch("garbage.avi", "this is not a video file");

    auto opened = media::MediaStream::open(file);
    ASSERT_FALSE(opened.ok());
}

class VideoClipTest : public ::testing::Test {
protected:
    void SetUp() override {
        clip = dir.path() / "clip.avi";
        ASSERT_TRUE(writeClip(clip));
    }

    TempDir dir;
    std::filesystem::path clip;
};

TEST_F(VideoClipTest, DecoderDescribesClip) {
    media::VideoDecoderConfig config;
    config.path = clip;

    auto opened = media::VideoDecoder::open(config);
    ASSERT_TRUE(opened.ok()) << opened.error().what();
    auto& decoder = *opened.value();

    EXPECT_EQ(decoder.codecName(), "mjpeg");
    EXPECT_EQ(decoder.resolution().width, kClipWidth);
    EXPECT_EQ(decoder.resolution().height, kClipHeight);
    EXPECT_EQ(decoder.frameRate().num, 25);
    EXPECT_EQ(decoder.frameRate().den, 1);
    EXPECT_EQ(decoder.frameCount(), kClipFrames);
    EXPECT_EQ(decoder.info().type, "video");
    EXPECT_EQ(decoder.info().videoFormat, "RGB24");
}

TEST_F(VideoClipTest, DecoderReadsToEndOfFile) {
    media::VideoDecoderConfig config;
    config.path = clip;

    auto opened = media::VideoDecoder::open(config);
    ASSERT_TRUE(opened.ok()) << opened.error().what();
    auto& decoder = *opened.value();

    for (int k = 0; k < kClipFrames; ++k) {
        auto frame = decoder.readNextFrame();
        ASSERT_TRUE(frame.ok()) << "frame " << k << ": " << frame.error().what();
        EXPECT_TRUE(isGrey(frame.value(), clipLevel(k))) << "frame " << k;
        EXPECT_EQ(decoder.currentTime(), frameToTimestamp(k + 1, {25, 1}));
    }

    auto end = decoder.readNextFrame();
    ASSERT_FALSE(end.ok());
    EXPECT_EQ(end.error().code(), ErrorCode::EndOfFile);
    EXPECT_FALSE(decoder.hasFrameRemaining());

    // Seeking clears the end state
    ASSERT_TRUE(decoder.setCurrentTime(frameToTimestamp(3, {25, 1})).ok());
    auto fourth = decoder.readNextFrame();
    ASSERT_TRUE(fourth.ok()) << fourth.error().what();
    EXPECT_TRUE(isGrey(fourth.value(), clipLevel(3)));
}

TEST_F(VideoClipTest, StreamReadsInOrderWithoutRepositioning) {
    auto opened = media::MediaStream::open(clip);
    ASSERT_TRUE(opened.ok()) << opened.error().what();
    media::MediaStream stream = std::move(opened).value();
    ASSERT_EQ(stream.numFrames(), kClipFrames);

    for (int64_t i = 1; i <= kClipFrames; ++i) {
        auto frame = stream.read(i);
        ASSERT_TRUE(frame.ok()) << "frame " << i << ": " << frame.error().what();
        EXPECT_TRUE(isGrey(frame.value(), clipLevel(i - 1))) << "frame " << i;
    }
    EXPECT_EQ(stream.stats().repositions, 0u);
    EXPECT_EQ(stream.stats().framesDecoded, static_cast<uint64_t>(kClipFrames));
}

TEST_F(VideoClipTest, StreamRepositionsForJumps) {
    auto opened = media::MediaStream::open(clip);
    ASSERT_TRUE(opened.ok()) << opened.error().what();
    media::MediaStream stream = std::move(opened).value();

    auto fifth = stream.read(5);
    ASSERT_TRUE(fifth.ok()) << fifth.error().what();
    EXPECT_TRUE(isGrey(fifth.value(), clipLevel(4)));

    auto second = stream.read(2);
    ASSERT_TRUE(second.ok()) << second.error().what();
    EXPECT_TRUE(isGrey(second.value(), clipLevel(1)));

    auto third = stream.read(3);
    ASSERT_TRUE(third.ok()) << third.error().what();
    EXPECT_TRUE(isGrey(third.value(), clipLevel(2)));
    EXPECT_EQ(stream.stats().repositions, 2u);

    auto last = stream.read(kLastFrame);
    ASSERT_TRUE(last.ok()) << last.error().what();
    EXPECT_TRUE(isGrey(last.value(), clipLevel(kClipFrames - 1)));
    EXPECT_EQ(stream.currentFrame(), kClipFrames);

    auto end = stream.readNextFrame();
    ASSERT_FALSE(end.ok());
    EXPECT_EQ(end.error().code(), ErrorCode::EndOfStream);
}

} // namespace reel::test
