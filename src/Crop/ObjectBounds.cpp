/*
 * Rmbg Crop Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Crop/ObjectBounds.hpp"

namespace Rmbg::Crop {

std::optional<ObjectBounds> detectObjectBounds(const Image::Mask &mask, std::uint8_t minThreshold)
{
	const std::size_t width = mask.getWidth();
	const std::size_t height = mask.getHeight();

	std::size_t minX = width;
	std::size_t minY = height;
	std::size_t maxX = 0;
	std::size_t maxY = 0;
	bool found = false;

	for (std::size_t y = 0; y < height; ++y) {
		const std::uint8_t *row = mask.row(y);
		for (std::size_t x = 0; x < width; ++x) {
			if (row[x] < minThreshold) {
				continue;
			}
			found = true;
			if (x < minX)
				minX = x;
			if (x > maxX)
				maxX = x;
			if (y < minY)
				minY = y;
			if (y > maxY)
				maxY = y;
		}
	}

	if (!found) {
		return std::nullopt;
	}

	ObjectBounds bounds;
	bounds.minX = minX;
	bounds.minY = minY;
	bounds.maxX = maxX;
	bounds.maxY = maxY;
	bounds.width = maxX - minX;
	bounds.height = maxY - minY;
	bounds.centerX = (minX + maxX) / 2;
	bounds.centerY = (minY + maxY) / 2;
	return bounds;
}

} // namespace Rmbg::Crop
