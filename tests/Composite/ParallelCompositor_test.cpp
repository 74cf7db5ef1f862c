/*
 * Rmbg
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <vector>

#include <Rmbg/Composite/ParallelCompositor.hpp>
#include <Rmbg/Core/Errors.hpp>

#include "../GenericImage.hpp"

using namespace Rmbg::Composite;
using namespace Rmbg::Image;

TEST(PartitionRowsTest, CoversEveryRowExactlyOnce)
{
	for (const std::size_t workers : {1u, 3u, 4u, 7u, 100u}) {
		const std::vector<RowRange> ranges = partitionRows(10, workers);
		ASSERT_FALSE(ranges.empty());
		EXPECT_LE(ranges.size(), 10u);
		EXPECT_EQ(ranges.front().begin, 0u);
		EXPECT_EQ(ranges.back().end, 10u);
		for (std::size_t i = 1; i < ranges.size(); ++i) {
			EXPECT_EQ(ranges[i].begin, ranges[i - 1].end);
			EXPECT_LT(ranges[i].begin, ranges[i].end);
		}
	}
}

TEST(PartitionRowsTest, ChunksAreBalanced)
{
	const std::vector<RowRange> ranges = partitionRows(10, 4);
	ASSERT_EQ(ranges.size(), 4u);
	EXPECT_EQ(ranges[0], (RowRange{0, 3}));
	EXPECT_EQ(ranges[1], (RowRange{3, 6}));
	EXPECT_EQ(ranges[2], (RowRange{6, 8}));
	EXPECT_EQ(ranges[3], (RowRange{8, 10}));
}

TEST(PartitionRowsTest, ZeroMeansHardwareThreads)
{
	const std::vector<RowRange> ranges = partitionRows(1000, 0);
	EXPECT_GE(ranges.size(), 1u);
	EXPECT_EQ(ranges.back().end, 1000u);
}

TEST(ParallelCompositorTest, BlendsAgainstWhite)
{
	PackedImage image(8, 6, PixelFormat::BGRA);
	image.fill({255, 0, 0, 255});

	Mask mask(8, 6, 0);
	for (std::size_t y = 0; y < 6; ++y) {
		for (std::size_t x = 4; x < 8; ++x) {
			mask.set(x, y, 255);
		}
	}
	mask.set(0, 0, 128);

	const PackedImage out = compositeOverBackground(image, mask, kWhite, 3);
	ASSERT_EQ(out.getWidth(), 8u);
	ASSERT_EQ(out.getHeight(), 6u);
	EXPECT_EQ(out.getFormat(), PixelFormat::RGBA);

	EXPECT_EQ(out.getPixel(5, 3), (ColorRGBA{255, 0, 0, 255}));
	EXPECT_EQ(out.getPixel(1, 3), (ColorRGBA{255, 255, 255, 255}));

	// alpha = 128 / 255: green and blue land on (1 - alpha) * 255 = 127.
	const ColorRGBA half = out.getPixel(0, 0);
	EXPECT_EQ(half.r, 255);
	EXPECT_EQ(half.g, 127);
	EXPECT_EQ(half.b, 127);
	EXPECT_EQ(half.a, 255);
}

TEST(ParallelCompositorTest, GenericImageAndCustomBackground)
{
	GenericImage image(5, 9, {0, 200, 0, 255});
	const Mask mask(5, 9, 0);

	const PackedImage out = compositeOverBackground(image, mask, {10, 20, 30, 255}, 4);
	for (std::size_t y = 0; y < 9; ++y) {
		for (std::size_t x = 0; x < 5; ++x) {
			EXPECT_EQ(out.getPixel(x, y), (ColorRGBA{10, 20, 30, 255}));
		}
	}
}

TEST(ParallelCompositorTest, ResultDoesNotDependOnWorkerCount)
{
	PackedImage image(31, 17);
	Mask mask(31, 17);
	for (std::size_t y = 0; y < 17; ++y) {
		for (std::size_t x = 0; x < 31; ++x) {
			image.setPixel(x, y, {static_cast<std::uint8_t>(x * 8), static_cast<std::uint8_t>(y * 15), 77, 255});
			mask.set(x, y, static_cast<std::uint8_t>((x * 13 + y * 7) % 256));
		}
	}

	const PackedImage single = compositeOverBackground(image, mask, kWhite, 1);
	const PackedImage many = compositeOverBackground(image, mask, kWhite, 16);
	ASSERT_EQ(single.getStride() * single.getHeight(), many.getStride() * many.getHeight());
	EXPECT_TRUE(std::equal(single.data(), single.data() + single.getStride() * single.getHeight(), many.data()));
}

TEST(ParallelCompositorTest, SizeMismatchIsInvalidMask)
{
	PackedImage image(4, 4);
	EXPECT_THROW(compositeOverBackground(image, Mask(4, 3)), Rmbg::Core::InvalidMaskError);
}
