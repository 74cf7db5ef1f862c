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

#include <Rmbg/Image/PackedImage.hpp>
#include <Rmbg/Segmenter/TensorConverter.hpp>

using namespace Rmbg::Image;
using namespace Rmbg::Segmenter;

namespace {

float normalized(std::uint8_t v, float mean, float std)
{
	return (static_cast<float>(v) / 255.0f - mean) / std;
}

} // anonymous namespace

TEST(TensorConverterTest, UniformImageFillsEveryPlane)
{
	PackedImage image(7, 5, PixelFormat::BGRA);
	image.fill({200, 100, 50, 255});

	const NormalizationParams normalization;
	std::vector<float> chw(3 * 4 * 4);
	fillInputTensor(image, 4, normalization, chw);

	const std::uint8_t rgb[3] = {200, 100, 50};
	for (std::size_t c = 0; c < 3; ++c) {
		const float expected = normalized(rgb[c], normalization.mean[c], normalization.std[c]);
		for (std::size_t i = 0; i < 16; ++i) {
			EXPECT_NEAR(chw[c * 16 + i], expected, 1e-4f) << "channel " << c << " index " << i;
		}
	}
}

TEST(TensorConverterTest, ChannelOrderIsRgbForBothPackedFormats)
{
	const NormalizationParams identity{{0.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f}};

	for (const PixelFormat format : {PixelFormat::RGBA, PixelFormat::BGRA}) {
		PackedImage image(2, 2, format);
		image.fill({255, 0, 51, 255});

		std::vector<float> chw(3 * 2 * 2);
		fillInputTensor(image, 2, identity, chw);

		EXPECT_NEAR(chw[0], 1.0f, 1e-6f);
		EXPECT_NEAR(chw[4], 0.0f, 1e-6f);
		EXPECT_NEAR(chw[8], 0.2f, 1e-6f);
	}
}

TEST(TensorConverterTest, DownscaleInterpolatesBetweenHalves)
{
	const NormalizationParams identity{{0.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f}};

	PackedImage image(4, 1);
	image.setPixel(0, 0, {0, 0, 0, 255});
	image.setPixel(1, 0, {0, 0, 0, 255});
	image.setPixel(2, 0, {255, 255, 255, 255});
	image.setPixel(3, 0, {255, 255, 255, 255});

	std::vector<float> chw(3 * 2 * 2);
	fillInputTensor(image, 2, identity, chw);

	// Each output column samples the center of its half of the row.
	EXPECT_NEAR(chw[0], 0.0f, 1e-6f);
	EXPECT_NEAR(chw[1], 1.0f, 1e-6f);
	EXPECT_LT(chw[0], chw[1]);
}

TEST(TensorConverterTest, RejectsShortDestination)
{
	PackedImage image(2, 2);
	std::vector<float> chw(3 * 4 * 4 - 1);
	EXPECT_THROW(fillInputTensor(image, 4, NormalizationParams{}, chw), std::invalid_argument);
}

TEST(TensorConverterTest, RejectsEmptyImage)
{
	PackedImage image;
	std::vector<float> chw(3 * 4 * 4);
	EXPECT_THROW(fillInputTensor(image, 4, NormalizationParams{}, chw), std::invalid_argument);
}

TEST(TensorConverterTest, BinarizeLogitsAgainstProbability)
{
	const std::vector<float> logits = {-4.0f, -0.1f, 0.1f, 4.0f};
	std::vector<std::uint8_t> mask(logits.size(), 7);

	binarizeLogits(logits, 0.5f, mask);

	EXPECT_EQ(mask[0], 0);
	EXPECT_EQ(mask[1], 0);
	EXPECT_EQ(mask[2], 255);
	EXPECT_EQ(mask[3], 255);
}
