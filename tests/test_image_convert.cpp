#include <gtest/gtest.h>
#include <reel/media/image_convert.hpp>
#include "test_helpers.hpp"

namespace reel::test {

using media::DecodedImage;
using media::Frame;
using media::Rgb;
using media::SampleType;

TEST(ColorFromCharTest, KnownCodes) {
    EXPECT_EQ(*media::colorFromChar('k'), (Rgb{0, 0, 0}));
    EXPECT_EQ(*media::colorFromChar('b'), (Rgb{0, 0, 255}));
    EXPECT_EQ(*media::colorFromChar('g'), (Rgb{0, 255, 0}));
    EXPECT_EQ(*media::colorFromChar('c'), (Rgb{0, 255, 255}));
    EXPECT_EQ(*media::colorFromChar('r'), (Rgb{255, 0, 0}));
    EXPECT_EQ(*media::colorFromChar('m'), (Rgb{255, 0, 255}));
    EXPECT_EQ(*media::colorFromChar('y'), (Rgb{255, 255, 0}));
    EXPECT_EQ(*media::colorFromChar('w'), (Rgb{255, 255, 255}));
}

TEST(ColorFromCharTest, UnknownCodes) {
    EXPECT_FALSE(media::colorFromChar('x').has_value());
    EXPECT_FALSE(media::colorFromChar('K').has_value());
    EXPECT_FALSE(media::colorFromChar('\0').has_value());
}

TEST(ParseBackgroundTest, CheckerboardAndColours) {
    auto board = media::parseBackground("checkerboard");
    ASSERT_TRUE(board.ok());
    EXPECT_FALSE(board.value().has_value());

    auto white = media::parseBackground("w");
    ASSERT_TRUE(white.ok());
    ASSERT_TRUE(white.value().has_value());
    EXPECT_EQ(*white.value(), (Rgb{255, 255, 255}));

    auto bad = media::parseBackground("white");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidArgument);
}

TEST(ExpandPaletteTest, LooksUpEveryPixel) {
    Frame indices = Frame::create(2, 1, 1).value();
    indices.setSample<uint8_t>(0, 0, 0, 1);
    indices.setSample<uint8_t>(1, 0, 0, 0);
    std::vector<media::PaletteEntry> palette = {{10, 20, 30}, {200, 100, 50}};

    auto rgb = media::expandPalette(indices, palette);
    ASSERT_TRUE(rgb.ok()) << rgb.error().what();
    const Frame& out = rgb.value();
    EXPECT_EQ(out.channels(), 3);
    EXPECT_EQ(out.sample<uint8_t>(0, 0, 0), 200);
    EXPECT_EQ(out.sample<uint8_t>(0, 0, 2), 50);
    EXPECT_EQ(out.sample<uint8_t>(1, 0, 1), 20);
}

TEST(ExpandPaletteTest, IndexOutsidePaletteIsInvalidData) {
    Frame indices = Frame::create(1, 1, 1).value();
    indices.setSample<uint8_t>(0, 0, 0, 5);
    std::vector<media::PaletteEntry> palette = {{0, 0, 0}};

    auto rgb = media::expandPalette(indices, palette);
    ASSERT_FALSE(rgb.ok());
    EXPECT_EQ(rgb.error().code(), ErrorCode::InvalidData);
}

TEST(CheckerboardTest, SmallImageSquares) {
    // Longest side 40: squares of floor(1 + 40/20) = 3 pixels
    Frame board = media::checkerboard(40, 10);
    EXPECT_EQ(board.width(), 40);
    EXPECT_EQ(board.height(), 10);
    EXPECT_EQ(board.sample<uint8_t>(0, 0, 0), 85);
    EXPECT_EQ(board.sample<uint8_t>(2, 2, 0), 85);
    EXPECT_EQ(board.sample<uint8_t>(3, 0, 0), 171);
    EXPECT_EQ(board.sample<uint8_t>(0, 3, 1), 171);
    EXPECT_EQ(board.sample<uint8_t>(3, 3, 2), 85);
}

TEST(ToRgb8Test, GreyIsReplicated) {
    DecodedImage image;
    image.pixels = solidFrame(2, 2, 1, 77);

    auto rgb = media::toRgb8(image, std::nullopt);
    ASSERT_TRUE(rgb.ok());
    EXPECT_EQ(rgb.value().channels(), 3);
    for (int c = 0; c < 3; ++c) {
        EXPECT_EQ(rgb.value().sample<uint8_t>(1, 1, c), 77);
    }
}

TEST(ToRgb8Test, DeepSamplesAreScaled) {
    DecodedImage image;
    image.pixels = Frame::create(1, 1, 3, SampleType::UInt16).value();
    image.pixels.setSample<uint16_t>(0, 0, 0, 65535);
    image.pixels.setSample<uint16_t>(0, 0, 1, 0);
    image.pixels.setSample<uint16_t>(0, 0, 2, 32896);

    auto rgb = media::toRgb8(image, std::nullopt);
    ASSERT_TRUE(rgb.ok());
    EXPECT_EQ(rgb.value().sample<uint8_t>(0, 0, 0), 255);
    EXPECT_EQ(rgb.value().sample<uint8_t>(0, 0, 1), 0);
    EXPECT_EQ(rgb.value().sample<uint8_t>(0, 0, 2), 128);
}

TEST(ToRgb8Test, AlphaCompositedOverColour) {
    DecodedImage image;
    image.pixels = solidFrame(1, 1, 3, 255);
    image.alpha = solidFrame(1, 1, 1, 0);

    auto overBlack = media::toRgb8(image, Rgb{0, 0, 0});
    ASSERT_TRUE(overBlack.ok());
    EXPECT_EQ(overBlack.value().sample<uint8_t>(0, 0, 0), 0);

    image.alpha = solidFrame(1, 1, 1, 255);
    auto opaque = media::toRgb8(image, Rgb{0, 0, 0});
    ASSERT_TRUE(opaque.ok());
    EXPECT_EQ(opaque.value().sample<uint8_t>(0, 0, 0), 255);
}

TEST(ToRgb8Test, TransparentPixelsShowCheckerboard) {
    DecodedImage image;
    image.pixels = solidFrame(4, 4, 3, 0);
    image.alpha = solidFrame(4, 4, 1, 0);

    auto rgb = media::toRgb8(image, std::nullopt);
    ASSERT_TRUE(rgb.ok());
    Frame board = media::checkerboard(4, 4);
    EXPECT_TRUE(rgb.value().sameContent(board));
}

TEST(ToRgb8Test, PaletteIsExpandedFirst) {
    DecodedImage image;
    image.pixels = Frame::create(1, 1, 1).value();
    image.palette = {{1, 2, 3}};

    auto rgb = media::toRgb8(image, std::nullopt);
    ASSERT_TRUE(rgb.ok());
    EXPECT_EQ(rgb.value().sample<uint8_t>(0, 0, 0), 1);
    EXPECT_EQ(rgb.value().sample<uint8_t>(0, 0, 1), 2);
    EXPECT_EQ(rgb.value().sample<uint8_t>(0, 0, 2), 3);
}

} // namespace reel::test
