/*
 * Rmbg
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <Rmbg/Image/Filters.hpp>
#include <Rmbg/Image/Mask.hpp>
#include <Rmbg/Image/PackedImage.hpp>

#include "../GenericImage.hpp"

using namespace Rmbg::Image;

TEST(PackedImageTest, StoresChannelsInFormatOrder)
{
	PackedImage rgba(2, 1, PixelFormat::RGBA);
	rgba.setPixel(1, 0, {1, 2, 3, 4});
	EXPECT_EQ(rgba.data()[4], 1);
	EXPECT_EQ(rgba.data()[6], 3);

	PackedImage bgra(2, 1, PixelFormat::BGRA);
	bgra.setPixel(1, 0, {1, 2, 3, 4});
	EXPECT_EQ(bgra.data()[4], 3);
	EXPECT_EQ(bgra.data()[6], 1);
	EXPECT_EQ(bgra.getPixel(1, 0), (ColorRGBA{1, 2, 3, 4}));
}

TEST(PackedImageTest, RejectsGrayFormat)
{
	EXPECT_THROW(PackedImage(2, 2, PixelFormat::Gray8), std::invalid_argument);
}

TEST(PackedImageTest, FromBufferHonorsStride)
{
	std::vector<std::uint8_t> padded(2 * 12, 0);
	padded[12 + 4] = 99;

	const PackedImage image = PackedImage::fromBuffer(padded.data(), 2, 2, 12, PixelFormat::RGBA);
	EXPECT_EQ(image.getPixel(1, 1).r, 99);
	EXPECT_EQ(image.getStride(), 8u);

	EXPECT_THROW(PackedImage::fromBuffer(padded.data(), 4, 2, 12, PixelFormat::RGBA), std::invalid_argument);
}

TEST(PackedImageTest, CopyRegion)
{
	PackedImage image(5, 5);
	image.setPixel(3, 2, kBlack);

	const PackedImage region = image.copyRegion(2, 1, 2, 2);
	EXPECT_EQ(region.getWidth(), 2u);
	EXPECT_EQ(region.getPixel(1, 1), kBlack);

	EXPECT_THROW(image.copyRegion(4, 4, 2, 2), std::out_of_range);
}

TEST(PackedImageTest, ToPackedImageFromGeneric)
{
	GenericImage generic(3, 2, {5, 6, 7, 8});
	generic.setPixel(2, 1, {9, 9, 9, 9});

	const PackedImage packed = toPackedImage(generic, PixelFormat::BGRA);
	EXPECT_EQ(packed.getPixel(0, 0), (ColorRGBA{5, 6, 7, 8}));
	EXPECT_EQ(packed.getPixel(2, 1), (ColorRGBA{9, 9, 9, 9}));
}

TEST(MaskTest, ReadsAsOpaqueGray)
{
	Mask mask(3, 3);
	mask.set(1, 2, 42);
	EXPECT_EQ(mask.getPixel(1, 2), (ColorRGBA{42, 42, 42, 255}));
	EXPECT_EQ(mask.getPixelBuffer()->format, PixelFormat::Gray8);
}

TEST(FiltersTest, GrayscaleUsesIntegerLuma)
{
	PackedImage packed(1, 1, PixelFormat::BGRA);
	packed.setPixel(0, 0, {100, 150, 200, 255});
	GenericImage generic(1, 1, {100, 150, 200, 255});

	const std::uint8_t expected = (299 * 100 + 587 * 150 + 114 * 200) / 1000;
	EXPECT_EQ(toGrayscale(packed).at(0, 0), expected);
	EXPECT_EQ(toGrayscale(generic).at(0, 0), expected);
}

TEST(FiltersTest, BlurKeepsUniformImage)
{
	PackedImage image(9, 7);
	image.fill({30, 60, 90, 255});

	const PackedImage blurred = gaussianBlur(image, 1.0);
	for (std::size_t y = 0; y < 7; ++y) {
		for (std::size_t x = 0; x < 9; ++x) {
			EXPECT_EQ(blurred.getPixel(x, y), (ColorRGBA{30, 60, 90, 255}));
		}
	}
}

TEST(FiltersTest, BlurSpreadsIsolatedPixel)
{
	PackedImage image(9, 9);
	image.fill(kBlack);
	image.setPixel(4, 4, kWhite);

	const PackedImage blurred = gaussianBlur(image, 1.0);
	EXPECT_LT(blurred.getPixel(4, 4).r, 255);
	EXPECT_GT(blurred.getPixel(4, 4).r, blurred.getPixel(5, 4).r);
	EXPECT_GT(blurred.getPixel(5, 4).r, 0);
	EXPECT_EQ(blurred.getPixel(0, 0).r, 0);
}
