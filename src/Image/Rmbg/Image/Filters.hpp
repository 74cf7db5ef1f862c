/*
 * Rmbg Image Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include "IImage.hpp"
#include "Mask.hpp"
#include "PackedImage.hpp"

namespace Rmbg::Image {

/**
 * @brief Reduces an image to single-channel BT.601 luma (299/587/114 over 1000).
 */
Mask toGrayscale(const IImage &image);

/**
 * @brief Separable Gaussian blur over all four channels with edge clamping.
 *
 * The kernel radius is ceil(3 * sigma). A non-positive sigma returns an unblurred copy.
 */
PackedImage gaussianBlur(const IImage &image, double sigma);

} // namespace Rmbg::Image
