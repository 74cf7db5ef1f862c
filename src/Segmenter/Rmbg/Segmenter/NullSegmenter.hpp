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
#include <stdexcept>

#include "ISegmenter.hpp"
#include "SigmoidTable.hpp"

namespace Rmbg::Segmenter {

class NullSegmenter final : public ISegmenter {
public:
	explicit NullSegmenter(std::size_t inputSize = 320) : inputSize_(inputSize)
	{
		if (inputSize_ == 0) {
			throw std::invalid_argument("NullSegmenter input size must be positive");
		}
	}

	~NullSegmenter() noexcept override = default;

	std::size_t getInputSize() const noexcept override { return inputSize_; }

	void infer(const float *, float *logits) override
	{
		std::fill_n(logits, inputSize_ * inputSize_, SigmoidTable::kMinLogit);
	}

private:
	const std::size_t inputSize_;
};

} // namespace Rmbg::Segmenter
