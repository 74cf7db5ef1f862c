/*
 * Rmbg Segmenter Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Segmenter/NcnnSegmenter.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <Rmbg/Core/Errors.hpp>

using Rmbg::Core::InferenceError;

namespace Rmbg::Segmenter {

namespace {

std::uintmax_t checkedFileSize(const std::filesystem::path &path)
{
	std::error_code ec;
	const std::uintmax_t size = std::filesystem::file_size(path, ec);
	if (ec) {
		throw InferenceError(fmt::format("cannot stat model file {}: {}", path.string(), ec.message()));
	}
	if (size == 0 || size > NcnnSegmenter::kMaxModelFileSize) {
		throw InferenceError(fmt::format("model file {} has unsupported size {}", path.string(), size));
	}
	return size;
}

template<typename Buffer> void readWholeFile(const std::filesystem::path &path, Buffer &buffer, std::uintmax_t size)
{
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs.is_open()) {
		throw InferenceError(fmt::format("cannot open model file {}", path.string()));
	}
	if (!ifs.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(size))) {
		throw InferenceError(fmt::format("cannot read model file {}", path.string()));
	}
}

} // anonymous namespace

NcnnSegmenter::NcnnSegmenter(ModelOptions options) : options_(std::move(options))
{
	if (options_.inputSize == 0) {
		throw InferenceError("model input size must be positive");
	}
	if (options_.outputBlobs.empty()) {
		throw InferenceError("at least one output blob is required");
	}

	net_.opt.num_threads = std::max(1, options_.numThreads);
	net_.opt.use_local_pool_allocator = options_.useLocalPoolAllocator;
	net_.opt.lightmode = options_.lightMode;

	const std::uintmax_t paramSize = checkedFileSize(options_.paramPath);
	std::vector<char> paramBuffer(paramSize + 1);
	readWholeFile(options_.paramPath, paramBuffer, paramSize);
	paramBuffer[paramSize] = '\0';

	if (net_.load_param_mem(paramBuffer.data()) != 0) {
		throw InferenceError(fmt::format("ncnn rejected param file {}", options_.paramPath.string()));
	}

	const std::uintmax_t binSize = checkedFileSize(options_.binPath);
	binBuffer_.resize(binSize);
	readWholeFile(options_.binPath, binBuffer_, binSize);

	if (net_.load_model(binBuffer_.data()) != static_cast<int>(binSize)) {
		throw InferenceError(fmt::format("ncnn rejected bin file {}", options_.binPath.string()));
	}

	const int size = static_cast<int>(options_.inputSize);
	inputMat_.create(size, size, 3);
	if (inputMat_.empty()) {
		throw InferenceError(fmt::format("cannot allocate a {}x{}x3 input tensor", size, size));
	}
}

void NcnnSegmenter::infer(const float *chw, float *logits)
{
	if (!chw || !logits) {
		throw InferenceError("infer received a null tensor pointer");
	}

	const int size = static_cast<int>(options_.inputSize);
	const std::size_t pixelCount = options_.inputSize * options_.inputSize;

	// Channel planes of inputMat_ are cstep apart, which is padded past pixelCount.
	for (int c = 0; c < 3; ++c) {
		const float *plane = chw + static_cast<std::size_t>(c) * pixelCount;
		std::copy(plane, plane + pixelCount, static_cast<float *>(inputMat_.channel(c)));
	}

	ncnn::Extractor ex = net_.create_extractor();
	if (ex.input(options_.inputBlob.c_str(), inputMat_) != 0) {
		throw InferenceError(fmt::format("cannot bind input blob {}", options_.inputBlob));
	}

	std::fill_n(logits, pixelCount, 0.0f);

	for (const std::string &blob : options_.outputBlobs) {
		ncnn::Mat output;
		if (ex.extract(blob.c_str(), output) != 0 || output.empty()) {
			throw InferenceError(fmt::format("cannot extract output blob {}", blob));
		}
		if (output.w != size || output.h != size) {
			throw InferenceError(fmt::format("output blob {} is {}x{}, expected {}x{}", blob, output.w,
							 output.h, size, size));
		}

		const float *src = output.channel(0);
		for (std::size_t i = 0; i < pixelCount; ++i) {
			logits[i] += src[i];
		}
	}

	if (options_.outputBlobs.size() > 1) {
		const float inv = 1.0f / static_cast<float>(options_.outputBlobs.size());
		for (std::size_t i = 0; i < pixelCount; ++i) {
			logits[i] *= inv;
		}
	}
}

} // namespace Rmbg::Segmenter
