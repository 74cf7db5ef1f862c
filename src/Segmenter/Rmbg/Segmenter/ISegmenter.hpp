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

namespace Rmbg::Segmenter {

/**
 * @brief A salient-object model with a square input of getInputSize() pixels per side.
 *
 * Implementations are not thread-safe; callers serialize infer().
 */
class ISegmenter {
protected:
	ISegmenter() = default;

public:
	virtual ~ISegmenter() = default;

	virtual std::size_t getInputSize() const noexcept = 0;

	/**
	 * @param chw 3 * size * size normalized floats, R, G and B planes.
	 * @param logits Receives size * size raw logits.
	 * @throw Rmbg::Core::InferenceError
	 */
	virtual void infer(const float *chw, float *logits) = 0;

	ISegmenter(const ISegmenter &) = delete;
	ISegmenter &operator=(const ISegmenter &) = delete;
	ISegmenter(ISegmenter &&) = delete;
	ISegmenter &operator=(ISegmenter &&) = delete;
};

} // namespace Rmbg::Segmenter
