/*
 * Rmbg Memory Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <algorithm>
#include <cstddef>

#include "AlignedAllocator.hpp"
#include "ObjectPool.hpp"

namespace Rmbg::Memory {

/**
 * @brief Intermediate buffers of the resize and blur stages.
 *
 * `tmp` receives the resized mask and `hPass` the horizontally blurred one.
 */
struct ScratchBuffers {
	ByteBuffer tmp;
	ByteBuffer hPass;

	/**
	 * @brief Sets both lengths to size. Capacity grows when needed and never shrinks.
	 */
	void resize(std::size_t size)
	{
		tmp.resize(size);
		hPass.resize(size);
	}

	std::size_t capacity() const noexcept { return std::min(tmp.capacity(), hPass.capacity()); }
};

using ScratchBufferPool = ObjectPool<ScratchBuffers>;

/**
 * @brief Input and output tensors of one inference call.
 *
 * `input` holds 3 channel-first planes and `output` one logit plane, both of
 * the model's square input size.
 */
struct InferenceTensors {
	explicit InferenceTensors(std::size_t inputSize)
		: input(3 * inputSize * inputSize),
		  output(inputSize * inputSize),
		  size(inputSize)
	{
	}

	FloatBuffer input;
	FloatBuffer output;
	const std::size_t size;
};

using InferenceTensorPool = ObjectPool<InferenceTensors>;

} // namespace Rmbg::Memory
