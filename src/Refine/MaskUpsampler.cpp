/*
 * Rmbg Refine Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Refine/MaskUpsampler.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <Rmbg/Core/Errors.hpp>

namespace Rmbg::Refine {

namespace {

constexpr std::size_t kBlurRadius = kBoxBlurWindow / 2;

inline std::size_t clampIndex(std::ptrdiff_t i, std::size_t extent) noexcept
{
	if (i < 0)
		return 0;
	if (static_cast<std::size_t>(i) >= extent)
		return extent - 1;
	return static_cast<std::size_t>(i);
}

/**
 * @brief One sliding-window pass over `count` samples spaced `step` apart.
 */
inline void blurLine(const std::uint8_t *src, std::uint8_t *dst, std::size_t count, std::size_t step) noexcept
{
	const auto radius = static_cast<std::ptrdiff_t>(kBlurRadius);

	unsigned int sum = 0;
	for (std::ptrdiff_t k = -radius; k <= radius; ++k) {
		sum += src[clampIndex(k, count) * step];
	}

	for (std::size_t i = 0; i < count; ++i) {
		dst[i * step] = static_cast<std::uint8_t>((sum + kBoxBlurWindow / 2) / kBoxBlurWindow);

		const auto pos = static_cast<std::ptrdiff_t>(i);
		sum += src[clampIndex(pos + radius + 1, count) * step];
		sum -= src[clampIndex(pos - radius, count) * step];
	}
}

} // anonymous namespace

void resizeBilinear(const std::uint8_t *src, std::size_t srcWidth, std::size_t srcHeight, std::uint8_t *dst,
		    std::size_t dstWidth, std::size_t dstHeight) noexcept
{
	const float scaleX = static_cast<float>(srcWidth) / static_cast<float>(dstWidth);
	const float scaleY = static_cast<float>(srcHeight) / static_cast<float>(dstHeight);
	const auto maxX = static_cast<float>(srcWidth - 1);
	const auto maxY = static_cast<float>(srcHeight - 1);

	for (std::size_t y = 0; y < dstHeight; ++y) {
		const float fy = std::clamp((static_cast<float>(y) + 0.5f) * scaleY - 0.5f, 0.0f, maxY);
		const auto y0 = static_cast<std::size_t>(fy);
		const std::size_t y1 = std::min(y0 + 1, srcHeight - 1);
		const float wy = fy - static_cast<float>(y0);

		const std::uint8_t *row0 = src + y0 * srcWidth;
		const std::uint8_t *row1 = src + y1 * srcWidth;
		std::uint8_t *out = dst + y * dstWidth;

		for (std::size_t x = 0; x < dstWidth; ++x) {
			const float fx = std::clamp((static_cast<float>(x) + 0.5f) * scaleX - 0.5f, 0.0f, maxX);
			const auto x0 = static_cast<std::size_t>(fx);
			const std::size_t x1 = std::min(x0 + 1, srcWidth - 1);
			const float wx = fx - static_cast<float>(x0);

			const float top = row0[x0] + (row0[x1] - row0[x0]) * wx;
			const float bottom = row1[x0] + (row1[x1] - row1[x0]) * wx;
			out[x] = static_cast<std::uint8_t>(std::clamp(top + (bottom - top) * wy + 0.5f, 0.0f, 255.0f));
		}
	}
}

void boxBlur5(const std::uint8_t *src, std::uint8_t *hPass, std::uint8_t *dst, std::size_t width,
	      std::size_t height) noexcept
{
	for (std::size_t y = 0; y < height; ++y) {
		blurLine(src + y * width, hPass + y * width, width, 1);
	}
	for (std::size_t x = 0; x < width; ++x) {
		blurLine(hPass + x, dst + x, height, width);
	}
}

MaskUpsampler::MaskUpsampler(std::shared_ptr<Memory::ScratchBufferPool> pool) : pool_(std::move(pool))
{
	if (!pool_) {
		throw std::invalid_argument("MaskUpsampler requires a scratch buffer pool");
	}
}

Image::Mask MaskUpsampler::upsample(const Image::Mask &mask, std::size_t targetWidth, std::size_t targetHeight) const
{
	if (mask.empty()) {
		throw Core::InvalidMaskError("cannot upsample an empty mask");
	}
	if (targetWidth == 0 || targetHeight == 0) {
		throw std::invalid_argument("upsample target size must be positive");
	}

	const Memory::ScratchBufferPool::Lease scratch = pool_->acquire();
	scratch->resize(targetWidth * targetHeight);

	resizeBilinear(mask.data(), mask.getWidth(), mask.getHeight(), scratch->tmp.data(), targetWidth, targetHeight);

	Image::Mask refined(targetWidth, targetHeight);
	boxBlur5(scratch->tmp.data(), scratch->hPass.data(), refined.data(), targetWidth, targetHeight);
	return refined;
}

} // namespace Rmbg::Refine
