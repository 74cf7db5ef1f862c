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

#include <Rmbg/Image/IImage.hpp>
#include <Rmbg/Image/Mask.hpp>
#include <Rmbg/Image/PackedImage.hpp>

#include "CropConfig.hpp"
#include "ObjectBounds.hpp"

namespace Rmbg::Crop {

struct CropRect {
	std::size_t x = 0;
	std::size_t y = 0;
	std::size_t width = 0;
	std::size_t height = 0;

	bool operator==(const CropRect &) const = default;
};

/**
 * @brief Maps mask-space bounds into image space and applies the margin and square policies.
 *
 * The result is clipped to the image and is never empty. When clipping truncates a
 * square expansion at an image edge the result may be non-square.
 *
 * @throw std::invalid_argument On a negative margin, a negative percent, non-positive scale or an empty image.
 */
CropRect computeCropRect(const ObjectBounds &bounds, double scaleX, double scaleY, const CropConfig &config,
			 std::size_t imageWidth, std::size_t imageHeight);

/**
 * @brief Crops the image to the object found in mask.
 *
 * scaleX and scaleY map mask coordinates to image coordinates (1.0 when both
 * share a resolution).
 *
 * @throw Rmbg::Core::InvalidMaskError If the mask is empty.
 * @throw Rmbg::Core::NoObjectDetectedError If no mask pixel reaches config.minThreshold.
 */
Image::PackedImage cropToObject(const Image::IImage &image, const Image::Mask &mask, const CropConfig &config,
				double scaleX = 1.0, double scaleY = 1.0);

} // namespace Rmbg::Crop
