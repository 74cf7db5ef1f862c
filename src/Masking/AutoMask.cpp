/*
 * Rmbg Masking Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Masking/MaskGenerator.hpp"

#include <Rmbg/Image/Filters.hpp>

using namespace Rmbg::Image;

namespace Rmbg::Masking {

Mask autoMask(const IImage &image)
{
	if (hasAlpha(image)) {
		return maskFromAlpha(image);
	}

	const BackgroundEstimate background = detectUniformBackground(image);
	if (background.isUniform) {
		return maskFromBackground(image, background.color, kAutoBackgroundTolerance);
	}

	const PackedImage blurred = gaussianBlur(image, kAutoBlurSigma);
	return maskFromEdges(blurred, kAutoEdgeThreshold);
}

} // namespace Rmbg::Masking
