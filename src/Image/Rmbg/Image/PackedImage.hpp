/*
 * Rmbg Image Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include <Rmbg/Memory/AlignedAllocator.hpp>

#include "IImage.hpp"

namespace Rmbg::Image {

/**
 * @brief Owning image with 4 bytes per pixel in RGBA or BGRA order.
 *
 * Alpha is straight (not premultiplied). Rows are tightly packed.
 */
class PackedImage final : public IImage {
public:
	PackedImage() noexcept = default;

	/**
	 * @throw std::invalid_argument If format is not a 4-byte format.
	 */
	PackedImage(std::size_t width, std::size_t height, PixelFormat format = PixelFormat::RGBA);

	/**
	 * @brief Copies width x height pixels out of a caller-owned buffer.
	 */
	static PackedImage fromBuffer(const std::uint8_t *data, std::size_t width, std::size_t height,
				      std::size_t stride, PixelFormat format);

	~PackedImage() override = default;

	PackedImage(const PackedImage &) = default;
	PackedImage &operator=(const PackedImage &) = default;
	PackedImage(PackedImage &&) noexcept = default;
	PackedImage &operator=(PackedImage &&) noexcept = default;

	std::size_t getWidth() const noexcept override { return width_; }
	std::size_t getHeight() const noexcept override { return height_; }
	std::size_t getStride() const noexcept { return width_ * 4; }
	PixelFormat getFormat() const noexcept { return format_; }

	ColorRGBA getPixel(std::size_t x, std::size_t y) const override;
	void setPixel(std::size_t x, std::size_t y, ColorRGBA color);
	void fill(ColorRGBA color);

	std::optional<PixelBufferView> getPixelBuffer() const noexcept override
	{
		return PixelBufferView{pixels_.data(), getStride(), format_};
	}

	std::uint8_t *data() noexcept { return pixels_.data(); }
	const std::uint8_t *data() const noexcept { return pixels_.data(); }
	std::uint8_t *row(std::size_t y) noexcept { return pixels_.data() + y * getStride(); }
	const std::uint8_t *row(std::size_t y) const noexcept { return pixels_.data() + y * getStride(); }

	/**
	 * @brief Returns a copy of the given region. The region must lie within the image.
	 */
	PackedImage copyRegion(std::size_t x, std::size_t y, std::size_t width, std::size_t height) const;

private:
	std::size_t width_ = 0;
	std::size_t height_ = 0;
	PixelFormat format_ = PixelFormat::RGBA;
	Memory::ByteBuffer pixels_;
};

/**
 * @brief Copies any image into a packed RGBA image, using the packed buffer when available.
 */
PackedImage toPackedImage(const IImage &image, PixelFormat format = PixelFormat::RGBA);

} // namespace Rmbg::Image
