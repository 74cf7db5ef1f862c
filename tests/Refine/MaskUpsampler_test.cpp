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
#include <memory>
#include <stdexcept>
#include <vector>

#include <Rmbg/Core/Errors.hpp>
#include <Rmbg/Refine/MaskUpsampler.hpp>

#include "../NullLogger.hpp"

using namespace Rmbg::Refine;
using Rmbg::Image::Mask;
using Rmbg::Memory::ScratchBufferPool;

TEST(ResizeBilinearTest, IdentitySizeCopies)
{
	const std::vector<std::uint8_t> src = {0, 50, 100, 150, 200, 250};
	std::vector<std::uint8_t> dst(6);
	resizeBilinear(src.data(), 3, 2, dst.data(), 3, 2);
	EXPECT_EQ(dst, src);
}

TEST(ResizeBilinearTest, UpscaleInterpolatesAndClampsEdges)
{
	const std::vector<std::uint8_t> src = {0, 200};
	std::vector<std::uint8_t> dst(4);
	resizeBilinear(src.data(), 2, 1, dst.data(), 4, 1);

	// Sample positions are -0.25, 0.25, 0.75 and 1.25 in source pixels.
	EXPECT_EQ(dst[0], 0);
	EXPECT_EQ(dst[1], 50);
	EXPECT_EQ(dst[2], 150);
	EXPECT_EQ(dst[3], 200);
}

TEST(BoxBlurTest, UniformInputIsUnchanged)
{
	const std::vector<std::uint8_t> src(7 * 5, 123);
	std::vector<std::uint8_t> hPass(src.size());
	std::vector<std::uint8_t> dst(src.size());
	boxBlur5(src.data(), hPass.data(), dst.data(), 7, 5);
	EXPECT_EQ(dst, src);
}

TEST(BoxBlurTest, SlidingSumMatchesDirectWindow)
{
	const std::size_t width = 9;
	const std::vector<std::uint8_t> src = {0, 255, 0, 0, 100, 0, 0, 0, 50};
	std::vector<std::uint8_t> hPass(width);
	std::vector<std::uint8_t> dst(width);
	boxBlur5(src.data(), hPass.data(), dst.data(), width, 1);

	for (std::size_t x = 0; x < width; ++x) {
		unsigned int sum = 0;
		for (int k = -2; k <= 2; ++k) {
			const int i = std::clamp(static_cast<int>(x) + k, 0, static_cast<int>(width) - 1);
			sum += src[static_cast<std::size_t>(i)];
		}
		EXPECT_EQ(hPass[x], (sum + 2) / 5) << "x=" << x;
		// A single row blurs vertically onto itself.
		EXPECT_EQ(dst[x], hPass[x]) << "x=" << x;
	}
}

TEST(BoxBlurTest, VerticalPassUsesColumns)
{
	std::vector<std::uint8_t> src(1 * 5, 0);
	src[2] = 250;
	std::vector<std::uint8_t> hPass(src.size());
	std::vector<std::uint8_t> dst(src.size());
	boxBlur5(src.data(), hPass.data(), dst.data(), 1, 5);

	for (const std::uint8_t v : dst) {
		EXPECT_EQ(v, 50);
	}
}

TEST(MaskUpsamplerTest, ProducesTargetSize)
{
	auto pool = ScratchBufferPool::create(std::make_shared<NullLogger>());
	const MaskUpsampler upsampler(pool);

	Mask mask(4, 4, 0);
	for (std::size_t y = 0; y < 4; ++y) {
		mask.set(2, y, 255);
		mask.set(3, y, 255);
	}

	const Mask refined = upsampler.upsample(mask, 40, 30);
	ASSERT_EQ(refined.getWidth(), 40u);
	ASSERT_EQ(refined.getHeight(), 30u);
	EXPECT_EQ(refined.at(2, 15), 0);
	EXPECT_EQ(refined.at(37, 15), 255);
	EXPECT_GT(refined.at(20, 15), 0);
	EXPECT_LT(refined.at(20, 15), 255);

	EXPECT_EQ(pool->getIdleCount(), 1u);
}

TEST(MaskUpsamplerTest, ReusesScratchBuffers)
{
	auto pool = ScratchBufferPool::create(std::make_shared<NullLogger>());
	const MaskUpsampler upsampler(pool);
	const Mask mask(2, 2, 128);

	upsampler.upsample(mask, 20, 10);
	upsampler.upsample(mask, 5, 5);
	EXPECT_EQ(pool->getIdleCount(), 1u);

	auto buffers = pool->acquire();
	EXPECT_GE(buffers->capacity(), 200u);
}

TEST(MaskUpsamplerTest, RejectsEmptyInput)
{
	const MaskUpsampler upsampler(ScratchBufferPool::create(std::make_shared<NullLogger>()));
	EXPECT_THROW(upsampler.upsample(Mask{}, 10, 10), Rmbg::Core::InvalidMaskError);
	EXPECT_THROW(upsampler.upsample(Mask(2, 2), 0, 10), std::invalid_argument);
	EXPECT_THROW(MaskUpsampler(nullptr), std::invalid_argument);
}
