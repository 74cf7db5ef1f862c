/*
 * Rmbg Masking Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <functional>

#include <Rmbg/Image/Color.hpp>
#include <Rmbg/Image/IImage.hpp>
#include <Rmbg/Image/Mask.hpp>

namespace Rmbg::Masking {

/**
 * @brief Any strategy turning an image into a single-channel mask of the same size.
 */
using MaskFunction = std::function<Image::Mask(const Image::IImage &)>;

constexpr double kAutoBackgroundTolerance = 200.0;
constexpr double kAutoEdgeThreshold = 200.0;
constexpr double kAutoBlurSigma = 1.0;

/**
 * @brief Mean squared 16-bit color distance of the border samples below which
 * the background is considered uniform.
 */
constexpr double kUniformVarianceLimit = 2e8;

struct BackgroundEstimate {
	Image::ColorRGBA color;
	double variance;
	bool isUniform;
};

/**
 * @brief Samples a 5x5 grid of cell centers and reports whether any of them is
 * less than fully opaque.
 */
bool hasAlpha(const Image::IImage &image);

/**
 * @brief Estimates the background from the four corners and the top and bottom
 * edge midpoints.
 */
BackgroundEstimate detectUniformBackground(const Image::IImage &image);

/**
 * @brief Uses the alpha channel as the mask. Images without alpha give 255 everywhere.
 */
Image::Mask maskFromAlpha(const Image::IImage &image);

/**
 * @brief Marks pixels whose color is farther than tolerance (8-bit units) from
 * the background color.
 */
Image::Mask maskFromBackground(const Image::IImage &image, Image::ColorRGBA background, double tolerance);

/**
 * @brief Sobel edge mask. Pixels on the one-pixel border are always 0.
 */
Image::Mask maskFromEdges(const Image::IImage &image, double threshold);

/**
 * @brief Picks the most reliable signal: alpha, then a uniform background, then
 * edges of a slightly blurred copy.
 */
Image::Mask autoMask(const Image::IImage &image);

} // namespace Rmbg::Masking
