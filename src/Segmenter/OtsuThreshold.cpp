/*
 * Rmbg Segmenter Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Segmenter/OtsuThreshold.hpp"

#include <algorithm>

namespace Rmbg::Segmenter {

Histogram buildSigmoidHistogram(std::span<const float> logits, const SigmoidTable &table)
{
	Histogram histogram{};
	for (const float logit : logits) {
		const int bin = static_cast<int>(table.lookup(logit) * 255.0f);
		++histogram[static_cast<std::size_t>(std::clamp(bin, 0, 255))];
	}
	return histogram;
}

std::size_t otsuSplit(const Histogram &histogram)
{
	std::size_t total = 0;
	double sum = 0.0;
	for (std::size_t t = 0; t < histogram.size(); ++t) {
		total += histogram[t];
		sum += static_cast<double>(t) * static_cast<double>(histogram[t]);
	}

	double sumB = 0.0;
	std::size_t wB = 0;
	double varMax = 0.0;
	std::size_t threshold = 0;

	for (std::size_t t = 0; t + 1 < histogram.size(); ++t) {
		wB += histogram[t];
		if (wB == 0) {
			continue;
		}

		const std::size_t wF = total - wB;
		if (wF == 0) {
			break;
		}

		sumB += static_cast<double>(t) * static_cast<double>(histogram[t]);
		const double mB = sumB / static_cast<double>(wB);
		const double mF = (sum - sumB) / static_cast<double>(wF);
		const double varBetween = static_cast<double>(wB) * static_cast<double>(wF) * (mB - mF) * (mB - mF);

		if (varBetween > varMax) {
			varMax = varBetween;
			threshold = t;
		}
	}

	return threshold;
}

float otsuThreshold(std::span<const float> logits, const SigmoidTable &table)
{
	return static_cast<float>(otsuSplit(buildSigmoidHistogram(logits, table))) / 255.0f;
}

} // namespace Rmbg::Segmenter
