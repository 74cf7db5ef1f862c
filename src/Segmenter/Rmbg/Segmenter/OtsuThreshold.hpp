/*
 * Rmbg Segmenter Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <array>
#include <cstddef>
#include <span>

#include "SigmoidTable.hpp"

namespace Rmbg::Segmenter {

using Histogram = std::array<std::size_t, 256>;

/**
 * @brief Histogram of sigmoid(logit) scaled to 8-bit bins, using the lookup table.
 */
Histogram buildSigmoidHistogram(std::span<const float> logits, const SigmoidTable &table);

/**
 * @brief Otsu split of a histogram: the bin maximizing between-class variance.
 *
 * The first maximizing bin wins ties. Returns 0 if no split has mass on both sides.
 */
std::size_t otsuSplit(const Histogram &histogram);

/**
 * @brief Adaptive binarization cutoff of a logit field, as a probability in [0, 1].
 *
 * For fields with mass on both the low and high ends the result lies strictly
 * between 0 and 1.
 */
float otsuThreshold(std::span<const float> logits, const SigmoidTable &table = SigmoidTable::shared());

} // namespace Rmbg::Segmenter
