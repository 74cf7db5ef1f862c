/*
 * Rmbg Crop Library
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

#include <Rmbg/Image/Mask.hpp>

namespace Rmbg::Crop {

/**
 * @brief Smallest axis-aligned rectangle holding every qualifying mask pixel.
 *
 * width and height are max - min, so a single qualifying pixel has zero extent.
 */
struct ObjectBounds {
	std::size_t minX = 0;
	std::size_t minY = 0;
	std::size_t maxX = 0;
	std::size_t maxY = 0;
	std::size_t width = 0;
	std::size_t height = 0;
	std::size_t centerX = 0;
	std::size_t centerY = 0;

	bool operator==(const ObjectBounds &) const = default;
};

/**
 * @brief Scans the mask once for pixels >= minThreshold.
 *
 * @return std::nullopt when no pixel qualifies.
 */
std::optional<ObjectBounds> detectObjectBounds(const Image::Mask &mask, std::uint8_t minThreshold);

} // namespace Rmbg::Crop
