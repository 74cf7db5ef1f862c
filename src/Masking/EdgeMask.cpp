/*
 * Rmbg Masking Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Masking/MaskGenerator.hpp"

#include <cstddef>
#include <cstdint>

#include <Rmbg/Image/Filters.hpp>

using namespace Rmbg::Image;

namespace Rmbg::Masking {

Mask maskFromEdges(const IImage &image, double threshold)
{
	const std::size_t width = image.getWidth();
	const std::size_t height = image.getHeight();
	Mask mask(width, height);

	if (width < 3 || height < 3) {
		return mask;
	}

	const Mask gray = toGrayscale(image);
	const double thresholdSq = threshold * threshold;

	for (std::size_t y = 1; y < height - 1; ++y) {
		const std::uint8_t *row0 = gray.row(y - 1);
		const std::uint8_t *row1 = gray.row(y);
		const std::uint8_t *row2 = gray.row(y + 1);
		std::uint8_t *dst = mask.row(y);

		for (std::size_t x = 1; x < width - 1; ++x) {
			const int tl = row0[x - 1], tc = row0[x], tr = row0[x + 1];
			const int ml = row1[x - 1], mr = row1[x + 1];
			const int bl = row2[x - 1], bc = row2[x], br = row2[x + 1];

			const std::int64_t gx = (tr + 2 * mr + br) - (tl + 2 * ml + bl);
			const std::int64_t gy = (bl + 2 * bc + br) - (tl + 2 * tc + tr);

			dst[x] = static_cast<double>(gx * gx + gy * gy) > thresholdSq ? kOpaque : 0;
		}
	}
	return mask;
}

} // namespace Rmbg::Masking
