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
 * @brief Single-channel 8-bit grid.
 *
 * Values are either binary (0 or 255) when used for bounds detection or
 * continuous when used as alpha for blending. As an IImage a mask reads as
 * an opaque gray image.
 */
class Mask final : public IImage {
public:
	Mask() noexcept = default;

	Mask(std::size_t width, std::size_t height, std::uint8_t fillValue = 0)
		: width_(width),
		  height_(height),
		  values_(width * height, fillValue)
	{
	}

	~Mask() override = default;

	Mask(const Mask &) = default;
	Mask &operator=(const Mask &) = default;
	Mask(Mask &&) noexcept = default;
	Mask &operator=(Mask &&) noexcept = default;

	std::size_t getWidth() const noexcept override { return width_; }
	std::size_t getHeight() const noexcept override { return height_; }

	ColorRGBA getPixel(std::size_t x, std::size_t y) const override
	{
		const std::uint8_t v = at(x, y);
		return {v, v, v, kOpaque};
	}

	std::optional<PixelBufferView> getPixelBuffer() const noexcept override
	{
		return PixelBufferView{values_.data(), width_, PixelFormat::Gray8};
	}

	std::uint8_t at(std::size_t x, std::size_t y) const noexcept { return values_[y * width_ + x]; }
	void set(std::size_t x, std::size_t y, std::uint8_t value) noexcept { values_[y * width_ + x] = value; }

	std::uint8_t *data() noexcept { return values_.data(); }
	const std::uint8_t *data() const noexcept { return values_.data(); }
	std::uint8_t *row(std::size_t y) noexcept { return values_.data() + y * width_; }
	const std::uint8_t *row(std::size_t y) const noexcept { return values_.data() + y * width_; }

	std::size_t size() const noexcept { return values_.size(); }

private:
	std::size_t width_ = 0;
	std::size_t height_ = 0;
	Memory::ByteBuffer values_;
};

} // namespace Rmbg::Image
