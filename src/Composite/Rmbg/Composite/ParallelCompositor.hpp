/*
 * Rmbg Composite Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <vector>

#include <Rmbg/Image/Color.hpp>
#include <Rmbg/Image/IImage.hpp>
#include <Rmbg/Image/Mask.hpp>
#include <Rmbg/Image/PackedImage.hpp>

namespace Rmbg::Composite {

struct RowRange {
	std::size_t begin;
	std::size_t end;

	bool operator==(const RowRange &) const = default;
};

/**
 * @brief Splits [0, rowCount) into contiguous, disjoint, near-equal chunks.
 *
 * workerCount 0 means one chunk per hardware thread. Never yields more chunks than rows.
 */
std::vector<RowRange> partitionRows(std::size_t rowCount, std::size_t workerCount);

/**
 * @brief out = alpha * src + (1 - alpha) * background per channel, alpha = mask / 255.
 *
 * Every row chunk runs on its own worker. The call returns only after all
 * workers finished and rethrows the first worker failure.
 *
 * @return An opaque RGBA image of the source size.
 * @throw Rmbg::Core::InvalidMaskError If the mask size differs from the image size.
 */
Image::PackedImage compositeOverBackground(const Image::IImage &image, const Image::Mask &mask,
					   Image::ColorRGBA background = Image::kWhite, std::size_t workerCount = 0);

} // namespace Rmbg::Composite
