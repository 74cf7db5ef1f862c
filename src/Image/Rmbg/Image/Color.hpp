/*
 * Rmbg Image Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>

namespace Rmbg::Image {

struct ColorRGBA {
	std::uint8_t r, g, b, a;

	constexpr bool operator==(const ColorRGBA &) const noexcept = default;
};

constexpr ColorRGBA kWhite = {255, 255, 255, 255};
constexpr ColorRGBA kBlack = {0, 0, 0, 255};
constexpr ColorRGBA kTransparent = {0, 0, 0, 0};

constexpr std::uint8_t kOpaque = 255;

/**
 * @brief Widens an 8-bit channel to 16-bit channel space (0-65535).
 */
constexpr std::uint32_t to16(std::uint8_t value) noexcept
{
	return static_cast<std::uint32_t>(value) * 257u;
}

/**
 * @brief ITU-R BT.601 luma with integer weights.
 */
constexpr std::uint8_t luma(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept
{
	return static_cast<std::uint8_t>((299u * r + 587u * g + 114u * b) / 1000u);
}

} // namespace Rmbg::Image
