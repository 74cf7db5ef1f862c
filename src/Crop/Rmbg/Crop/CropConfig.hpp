/*
 * Rmbg Crop Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>

namespace Rmbg::Crop {

struct CropConfig {
	/** Fixed padding in pixels on every side. */
	int margin = 0;
	/** Fraction of the object size; when > 0 the larger of this and margin wins. */
	double marginPercent = 0.0;
	/** Mask values at or above this count as object. */
	std::uint8_t minThreshold = 10;
	bool squareCrop = false;

	/**
	 * @brief Settings used when a caller does not pass its own.
	 */
	static CropConfig defaults() noexcept
	{
		CropConfig config;
		config.margin = 20;
		return config;
	}

	bool operator==(const CropConfig &) const = default;
};

} // namespace Rmbg::Crop
