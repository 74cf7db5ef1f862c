/*
 * Rmbg Masking Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Masking/MaskGenerator.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

using namespace Rmbg::Image;

namespace Rmbg::Masking {

namespace {

inline std::uint64_t squaredDistance16(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::int64_t bgR,
				       std::int64_t bgG, std::int64_t bgB) noexcept
{
	const std::int64_t dr = static_cast<std::int64_t>(to16(r)) - bgR;
	const std::int64_t dg = static_cast<std::int64_t>(to16(g)) - bgG;
	const std::int64_t db = static_cast<std::int64_t>(to16(b)) - bgB;
	return static_cast<std::uint64_t>(dr * dr + dg * dg + db * db);
}

} // anonymous namespace

BackgroundEstimate detectUniformBackground(const IImage &image)
{
	const std::size_t width = image.getWidth();
	const std::size_t height = image.getHeight();
	if (width == 0 || height == 0) {
		return {kWhite, 0.0, false};
	}

	const std::size_t right = width - 1;
	const std::size_t bottom = height - 1;
	const std::array<ColorRGBA, 6> samples = {
		image.getPixel(0, 0),         image.getPixel(right, 0),         image.getPixel(0, bottom),
		image.getPixel(right, bottom), image.getPixel(width / 2, 0), image.getPixel(width / 2, bottom),
	};

	double rSum = 0.0, gSum = 0.0, bSum = 0.0;
	for (const ColorRGBA &c : samples) {
		rSum += to16(c.r);
		gSum += to16(c.g);
		bSum += to16(c.b);
	}

	const double n = static_cast<double>(samples.size());
	const double rAvg = rSum / n;
	const double gAvg = gSum / n;
	const double bAvg = bSum / n;

	double variance = 0.0;
	for (const ColorRGBA &c : samples) {
		const double dr = to16(c.r) - rAvg;
		const double dg = to16(c.g) - gAvg;
		const double db = to16(c.b) - bAvg;
		variance += dr * dr + dg * dg + db * db;
	}
	variance /= n;

	const ColorRGBA color = {static_cast<std::uint8_t>(rAvg / 257.0), static_cast<std::uint8_t>(gAvg / 257.0),
				 static_cast<std::uint8_t>(bAvg / 257.0), kOpaque};
	return {color, variance, variance < kUniformVarianceLimit};
}

Mask maskFromBackground(const IImage &image, ColorRGBA background, double tolerance)
{
	const std::size_t width = image.getWidth();
	const std::size_t height = image.getHeight();
	Mask mask(width, height);

	const std::int64_t bgR = to16(background.r);
	const std::int64_t bgG = to16(background.g);
	const std::int64_t bgB = to16(background.b);
	const double limit = tolerance * tolerance * 257.0 * 257.0;

	const auto buffer = image.getPixelBuffer();
	if (buffer && buffer->format != PixelFormat::Gray8) {
		const std::size_t ri = buffer->format == PixelFormat::BGRA ? 2 : 0;
		const std::size_t bi = buffer->format == PixelFormat::BGRA ? 0 : 2;

		for (std::size_t y = 0; y < height; ++y) {
			const std::uint8_t *src = buffer->row(y);
			std::uint8_t *dst = mask.row(y);
			for (std::size_t x = 0; x < width; ++x) {
				const std::uint8_t *p = src + x * 4;
				const auto dist = squaredDistance16(p[ri], p[1], p[bi], bgR, bgG, bgB);
				dst[x] = static_cast<double>(dist) > limit ? kOpaque : 0;
			}
		}
		return mask;
	}

	for (std::size_t y = 0; y < height; ++y) {
		for (std::size_t x = 0; x < width; ++x) {
			const ColorRGBA c = image.getPixel(x, y);
			const auto dist = squaredDistance16(c.r, c.g, c.b, bgR, bgG, bgB);
			mask.set(x, y, static_cast<double>(dist) > limit ? kOpaque : 0);
		}
	}
	return mask;
}

} // namespace Rmbg::Masking
