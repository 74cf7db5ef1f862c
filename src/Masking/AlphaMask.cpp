/*
 * Rmbg Masking Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Masking/MaskGenerator.hpp"

#include <cstddef>
#include <cstring>

using namespace Rmbg::Image;

namespace Rmbg::Masking {

namespace {

constexpr std::size_t kAlphaSampleGrid = 5;

inline std::size_t sampleCoordinate(std::size_t index, std::size_t extent) noexcept
{
	return (2 * index + 1) * extent / (2 * kAlphaSampleGrid);
}

} // anonymous namespace

bool hasAlpha(const IImage &image)
{
	const std::size_t width = image.getWidth();
	const std::size_t height = image.getHeight();
	if (width == 0 || height == 0) {
		return false;
	}

	const auto buffer = image.getPixelBuffer();
	if (buffer && buffer->format == PixelFormat::Gray8) {
		return false;
	}

	for (std::size_t j = 0; j < kAlphaSampleGrid; ++j) {
		const std::size_t y = sampleCoordinate(j, height);
		for (std::size_t i = 0; i < kAlphaSampleGrid; ++i) {
			const std::size_t x = sampleCoordinate(i, width);
			const std::uint8_t alpha = buffer ? buffer->row(y)[x * 4 + 3] : image.getPixel(x, y).a;
			if (alpha < kOpaque) {
				return true;
			}
		}
	}
	return false;
}

Mask maskFromAlpha(const IImage &image)
{
	const std::size_t width = image.getWidth();
	const std::size_t height = image.getHeight();

	const auto buffer = image.getPixelBuffer();
	if (buffer && buffer->format == PixelFormat::Gray8) {
		return Mask(width, height, kOpaque);
	}

	Mask mask(width, height);

	if (buffer) {
		for (std::size_t y = 0; y < height; ++y) {
			const std::uint8_t *src = buffer->row(y) + 3;
			std::uint8_t *dst = mask.row(y);
			for (std::size_t x = 0; x < width; ++x) {
				dst[x] = src[x * 4];
			}
		}
		return mask;
	}

	for (std::size_t y = 0; y < height; ++y) {
		for (std::size_t x = 0; x < width; ++x) {
			mask.set(x, y, image.getPixel(x, y).a);
		}
	}
	return mask;
}

} // namespace Rmbg::Masking
