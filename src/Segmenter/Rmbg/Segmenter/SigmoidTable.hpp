/*
 * Rmbg Segmenter Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Rmbg::Segmenter {

/**
 * @brief Logistic sigmoid sampled at 256 evenly spaced logits in [-6, 6].
 *
 * The table is immutable once built. Use shared() for the process-wide
 * instance, built on first use.
 */
class SigmoidTable {
public:
	constexpr static std::size_t kSize = 256;
	constexpr static float kMinLogit = -6.0f;
	constexpr static float kMaxLogit = 6.0f;

	SigmoidTable() noexcept
	{
		for (std::size_t i = 0; i < kSize; ++i) {
			const double x = kMinLogit + (kMaxLogit - kMinLogit) * static_cast<double>(i) / (kSize - 1);
			values_[i] = static_cast<float>(1.0 / (1.0 + std::exp(-x)));
		}
	}

	static const SigmoidTable &shared() noexcept
	{
		static const SigmoidTable table;
		return table;
	}

	/**
	 * @brief Table index of a logit, clamped to [0, 255].
	 */
	static std::size_t indexOf(float logit) noexcept
	{
		const float position = (logit - kMinLogit) / (kMaxLogit - kMinLogit) * static_cast<float>(kSize - 1);
		if (!(position > 0.0f)) {
			return 0;
		}
		return std::min(static_cast<std::size_t>(position), kSize - 1);
	}

	float operator[](std::size_t index) const noexcept { return values_[index]; }

	float lookup(float logit) const noexcept { return values_[indexOf(logit)]; }

private:
	std::array<float, kSize> values_{};
};

} // namespace Rmbg::Segmenter
