/*
 * Rmbg Crop Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Crop/CropGeometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <Rmbg/Core/Errors.hpp>

using namespace Rmbg::Image;

namespace Rmbg::Crop {

namespace {

struct Span {
	long long begin;
	long long end;
};

inline void clipSpan(Span &span, long long extent) noexcept
{
	span.begin = std::clamp(span.begin, 0LL, extent);
	span.end = std::clamp(span.end, 0LL, extent);
	if (span.end <= span.begin) {
		// Keep at least one pixel so a point-sized object still yields an image.
		if (span.begin >= extent) {
			span.begin = extent - 1;
		}
		span.end = span.begin + 1;
	}
}

inline void growToLength(Span &span, long long target, long long extent) noexcept
{
	const long long diff = target - (span.end - span.begin);
	if (diff <= 0) {
		return;
	}
	span.begin -= diff / 2;
	span.end += diff - diff / 2;
	clipSpan(span, extent);
}

long long resolveMargin(const CropConfig &config, double objectWidth, double objectHeight)
{
	long long margin = config.margin;
	if (config.marginPercent > 0.0) {
		const auto percentX = std::llround(config.marginPercent * objectWidth);
		const auto percentY = std::llround(config.marginPercent * objectHeight);
		margin = std::max(margin, std::max(percentX, percentY));
	}
	return margin;
}

} // anonymous namespace

CropRect computeCropRect(const ObjectBounds &bounds, double scaleX, double scaleY, const CropConfig &config,
			 std::size_t imageWidth, std::size_t imageHeight)
{
	if (config.margin < 0 || config.marginPercent < 0.0 || std::isnan(config.marginPercent)) {
		throw std::invalid_argument("crop margin must not be negative");
	}
	if (!(scaleX > 0.0) || !(scaleY > 0.0)) {
		throw std::invalid_argument("crop scale must be positive");
	}
	if (imageWidth == 0 || imageHeight == 0) {
		throw std::invalid_argument("cannot crop an empty image");
	}

	const auto width = static_cast<long long>(imageWidth);
	const auto height = static_cast<long long>(imageHeight);

	Span xs{static_cast<long long>(static_cast<double>(bounds.minX) * scaleX),
		static_cast<long long>(static_cast<double>(bounds.maxX) * scaleX)};
	Span ys{static_cast<long long>(static_cast<double>(bounds.minY) * scaleY),
		static_cast<long long>(static_cast<double>(bounds.maxY) * scaleY)};

	const long long margin =
		resolveMargin(config, static_cast<double>(xs.end - xs.begin), static_cast<double>(ys.end - ys.begin));

	xs.begin -= margin;
	xs.end += margin;
	ys.begin -= margin;
	ys.end += margin;
	clipSpan(xs, width);
	clipSpan(ys, height);

	if (config.squareCrop) {
		const long long cropWidth = xs.end - xs.begin;
		const long long cropHeight = ys.end - ys.begin;
		if (cropWidth < cropHeight) {
			growToLength(xs, cropHeight, width);
		} else if (cropHeight < cropWidth) {
			growToLength(ys, cropWidth, height);
		}
	}

	return CropRect{static_cast<std::size_t>(xs.begin), static_cast<std::size_t>(ys.begin),
			static_cast<std::size_t>(xs.end - xs.begin), static_cast<std::size_t>(ys.end - ys.begin)};
}

PackedImage cropToObject(const IImage &image, const Mask &mask, const CropConfig &config, double scaleX,
			 double scaleY)
{
	if (mask.empty()) {
		throw Core::InvalidMaskError("crop received an empty mask");
	}

	const std::optional<ObjectBounds> bounds = detectObjectBounds(mask, config.minThreshold);
	if (!bounds) {
		throw Core::NoObjectDetectedError();
	}

	const CropRect rect =
		computeCropRect(*bounds, scaleX, scaleY, config, image.getWidth(), image.getHeight());

	if (const auto buffer = image.getPixelBuffer(); buffer && buffer->format != PixelFormat::Gray8) {
		return PackedImage::fromBuffer(buffer->row(rect.y) + rect.x * 4, rect.width, rect.height,
					       buffer->stride, buffer->format);
	}

	PackedImage cropped(rect.width, rect.height);
	for (std::size_t y = 0; y < rect.height; ++y) {
		for (std::size_t x = 0; x < rect.width; ++x) {
			cropped.setPixel(x, y, image.getPixel(rect.x + x, rect.y + y));
		}
	}
	return cropped;
}

} // namespace Rmbg::Crop
