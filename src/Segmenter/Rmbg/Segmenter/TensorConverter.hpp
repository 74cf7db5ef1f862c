/*
 * Rmbg Segmenter Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <Rmbg/Image/IImage.hpp>

#include "Normalization.hpp"

namespace Rmbg::Segmenter {

/**
 * @brief Resizes an image to size x size (bilinear) and writes normalized
 * channel-first R, G and B planes into chw.
 *
 * @param chw Destination of at least 3 * size * size floats.
 * @throw std::invalid_argument If the image is empty or chw is too small.
 */
void fillInputTensor(const Image::IImage &image, std::size_t size, const NormalizationParams &normalization,
		     std::span<float> chw);

/**
 * @brief Writes 255 where sigmoid(logit) > threshold and 0 elsewhere.
 */
void binarizeLogits(std::span<const float> logits, float threshold, std::span<std::uint8_t> mask);

} // namespace Rmbg::Segmenter
