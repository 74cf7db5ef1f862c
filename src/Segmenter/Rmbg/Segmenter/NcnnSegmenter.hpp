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
#include <vector>

#ifdef PREFIXED_NCNN_HEADERS
#include <ncnn/net.h>
#else
#include <net.h>
#endif

#include <Rmbg/Memory/AlignedAllocator.hpp>

#include "ISegmenter.hpp"
#include "ModelOptions.hpp"

namespace Rmbg::Segmenter {

class NcnnSegmenter final : public ISegmenter {
public:
	constexpr static std::uintmax_t kMaxModelFileSize = 512 * 1024 * 1024;

	/**
	 * @throw Rmbg::Core::InferenceError If the model files cannot be read or ncnn rejects them.
	 */
	explicit NcnnSegmenter(ModelOptions options);

	~NcnnSegmenter() noexcept override = default;

	std::size_t getInputSize() const noexcept override { return options_.inputSize; }

	void infer(const float *chw, float *logits) override;

private:
	const ModelOptions options_;

	Memory::ByteBuffer binBuffer_;
	ncnn::Net net_;
	ncnn::Mat inputMat_;
};

} // namespace Rmbg::Segmenter
