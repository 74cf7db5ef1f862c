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

#include "Color.hpp"

namespace Rmbg::Image {

enum class PixelFormat {
	RGBA,
	BGRA,
	Gray8,
};

constexpr std::size_t bytesPerPixel(PixelFormat format) noexcept
{
	return format == PixelFormat::Gray8 ? 1 : 4;
}

/**
 * @brief Direct view of a packed pixel buffer, used by the fast paths.
 */
struct PixelBufferView {
	const std::uint8_t *data;
	std::size_t stride;
	PixelFormat format;

	const std::uint8_t *row(std::size_t y) const noexcept { return data + y * stride; }
};

/**
 * @brief Read access to a rectangular pixel grid.
 *
 * Every image supports per-pixel reads. Images backed by a packed buffer also
 * expose it through getPixelBuffer() so that hot loops can index it linearly.
 */
class IImage {
protected:
	IImage() = default;
	IImage(const IImage &) = default;
	IImage &operator=(const IImage &) = default;
	IImage(IImage &&) = default;
	IImage &operator=(IImage &&) = default;

public:
	virtual ~IImage() = default;

	virtual std::size_t getWidth() const noexcept = 0;
	virtual std::size_t getHeight() const noexcept = 0;

	virtual ColorRGBA getPixel(std::size_t x, std::size_t y) const = 0;

	virtual std::optional<PixelBufferView> getPixelBuffer() const noexcept { return std::nullopt; }

	std::size_t getPixelCount() const noexcept { return getWidth() * getHeight(); }
	bool empty() const noexcept { return getWidth() == 0 || getHeight() == 0; }
};

} // namespace Rmbg::Image
