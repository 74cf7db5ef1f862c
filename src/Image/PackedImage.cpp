/*
 * Rmbg Image Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Image/PackedImage.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace Rmbg::Image {

namespace {

struct ChannelOrder {
	std::size_t r, g, b;
};

constexpr ChannelOrder channelOrderOf(PixelFormat format) noexcept
{
	return format == PixelFormat::BGRA ? ChannelOrder{2, 1, 0} : ChannelOrder{0, 1, 2};
}

} // anonymous namespace

PackedImage::PackedImage(std::size_t width, std::size_t height, PixelFormat format)
	: width_(width),
	  height_(height),
	  format_(format),
	  pixels_(width * height * 4, 0)
{
	if (format == PixelFormat::Gray8) {
		throw std::invalid_argument("PackedImage requires a 4-byte pixel format");
	}
}

PackedImage PackedImage::fromBuffer(const std::uint8_t *data, std::size_t width, std::size_t height,
				    std::size_t stride, PixelFormat format)
{
	if (!data && width * height > 0) {
		throw std::invalid_argument("PackedImage::fromBuffer received null data");
	}
	if (stride < width * 4) {
		throw std::invalid_argument("PackedImage::fromBuffer stride " + std::to_string(stride) +
					    " is smaller than a row of " + std::to_string(width) + " pixels");
	}

	PackedImage image(width, height, format);
	for (std::size_t y = 0; y < height; ++y) {
		std::memcpy(image.row(y), data + y * stride, width * 4);
	}
	return image;
}

ColorRGBA PackedImage::getPixel(std::size_t x, std::size_t y) const
{
	const std::uint8_t *p = row(y) + x * 4;
	const ChannelOrder order = channelOrderOf(format_);
	return {p[order.r], p[order.g], p[order.b], p[3]};
}

void PackedImage::setPixel(std::size_t x, std::size_t y, ColorRGBA color)
{
	std::uint8_t *p = row(y) + x * 4;
	const ChannelOrder order = channelOrderOf(format_);
	p[order.r] = color.r;
	p[order.g] = color.g;
	p[order.b] = color.b;
	p[3] = color.a;
}

void PackedImage::fill(ColorRGBA color)
{
	for (std::size_t y = 0; y < height_; ++y) {
		for (std::size_t x = 0; x < width_; ++x) {
			setPixel(x, y, color);
		}
	}
}

PackedImage PackedImage::copyRegion(std::size_t x, std::size_t y, std::size_t width, std::size_t height) const
{
	if (x + width > width_ || y + height > height_) {
		throw std::out_of_range("PackedImage::copyRegion region exceeds image bounds");
	}

	PackedImage region(width, height, format_);
	for (std::size_t row = 0; row < height; ++row) {
		std::memcpy(region.row(row), this->row(y + row) + x * 4, width * 4);
	}
	return region;
}

PackedImage toPackedImage(const IImage &image, PixelFormat format)
{
	const std::size_t width = image.getWidth();
	const std::size_t height = image.getHeight();
	const auto buffer = image.getPixelBuffer();

	if (buffer && buffer->format == format) {
		return PackedImage::fromBuffer(buffer->data, width, height, buffer->stride, format);
	}

	PackedImage packed(width, height, format);
	for (std::size_t y = 0; y < height; ++y) {
		for (std::size_t x = 0; x < width; ++x) {
			packed.setPixel(x, y, image.getPixel(x, y));
		}
	}
	return packed;
}

} // namespace Rmbg::Image
