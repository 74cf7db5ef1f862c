/*
 * Rmbg Image Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Image/Filters.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace Rmbg::Image {

namespace {

inline void grayscalePacked(Mask &gray, const PixelBufferView &buffer, std::size_t width, std::size_t height)
{
	const std::size_t ri = buffer.format == PixelFormat::BGRA ? 2 : 0;
	const std::size_t bi = buffer.format == PixelFormat::BGRA ? 0 : 2;

	for (std::size_t y = 0; y < height; ++y) {
		const std::uint8_t *src = buffer.row(y);
		std::uint8_t *dst = gray.row(y);
		for (std::size_t x = 0; x < width; ++x) {
			const std::uint8_t *p = src + x * 4;
			dst[x] = luma(p[ri], p[1], p[bi]);
		}
	}
}

std::vector<float> makeGaussianKernel(double sigma, int radius)
{
	std::vector<float> kernel(static_cast<std::size_t>(2 * radius + 1));
	double sum = 0.0;
	for (int i = -radius; i <= radius; ++i) {
		const double w = std::exp(-(i * i) / (2.0 * sigma * sigma));
		kernel[static_cast<std::size_t>(i + radius)] = static_cast<float>(w);
		sum += w;
	}
	for (float &w : kernel) {
		w = static_cast<float>(w / sum);
	}
	return kernel;
}

} // anonymous namespace

Mask toGrayscale(const IImage &image)
{
	const std::size_t width = image.getWidth();
	const std::size_t height = image.getHeight();
	Mask gray(width, height);

	const auto buffer = image.getPixelBuffer();
	if (buffer && buffer->format == PixelFormat::Gray8) {
		for (std::size_t y = 0; y < height; ++y) {
			std::memcpy(gray.row(y), buffer->row(y), width);
		}
		return gray;
	}

	if (buffer) {
		grayscalePacked(gray, *buffer, width, height);
		return gray;
	}

	for (std::size_t y = 0; y < height; ++y) {
		for (std::size_t x = 0; x < width; ++x) {
			const ColorRGBA c = image.getPixel(x, y);
			gray.set(x, y, luma(c.r, c.g, c.b));
		}
	}
	return gray;
}

PackedImage gaussianBlur(const IImage &image, double sigma)
{
	PackedImage source = toPackedImage(image, PixelFormat::RGBA);
	if (sigma <= 0.0 || source.empty()) {
		return source;
	}

	const int radius = static_cast<int>(std::ceil(3.0 * sigma));
	const std::vector<float> kernel = makeGaussianKernel(sigma, radius);

	const int width = static_cast<int>(source.getWidth());
	const int height = static_cast<int>(source.getHeight());

	// Horizontal pass into a float intermediate, vertical pass back to 8 bits.
	std::vector<float> horizontal(static_cast<std::size_t>(width) * height * 4);
	for (int y = 0; y < height; ++y) {
		const std::uint8_t *src = source.row(static_cast<std::size_t>(y));
		float *dst = horizontal.data() + static_cast<std::size_t>(y) * width * 4;
		for (int x = 0; x < width; ++x) {
			float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
			for (int k = -radius; k <= radius; ++k) {
				const int sx = std::clamp(x + k, 0, width - 1);
				const float w = kernel[static_cast<std::size_t>(k + radius)];
				const std::uint8_t *p = src + sx * 4;
				for (int c = 0; c < 4; ++c) {
					acc[c] += w * static_cast<float>(p[c]);
				}
			}
			for (int c = 0; c < 4; ++c) {
				dst[x * 4 + c] = acc[c];
			}
		}
	}

	PackedImage blurred(source.getWidth(), source.getHeight(), PixelFormat::RGBA);
	for (int y = 0; y < height; ++y) {
		std::uint8_t *dst = blurred.row(static_cast<std::size_t>(y));
		for (int x = 0; x < width; ++x) {
			float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
			for (int k = -radius; k <= radius; ++k) {
				const int sy = std::clamp(y + k, 0, height - 1);
				const float w = kernel[static_cast<std::size_t>(k + radius)];
				const float *p = horizontal.data() + (static_cast<std::size_t>(sy) * width + x) * 4;
				for (int c = 0; c < 4; ++c) {
					acc[c] += w * p[c];
				}
			}
			for (int c = 0; c < 4; ++c) {
				dst[x * 4 + c] = static_cast<std::uint8_t>(std::clamp(acc[c] + 0.5f, 0.0f, 255.0f));
			}
		}
	}
	return blurred;
}

} // namespace Rmbg::Image
