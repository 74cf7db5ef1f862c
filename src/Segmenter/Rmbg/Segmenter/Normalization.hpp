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

namespace Rmbg::Segmenter {

/**
 * @brief Per-channel normalization applied to the model input: (v / 255 - mean) / std, RGB order.
 */
struct NormalizationParams {
	std::array<float, 3> mean = {0.485f, 0.456f, 0.406f};
	std::array<float, 3> std = {0.229f, 0.224f, 0.225f};
};

} // namespace Rmbg::Segmenter
