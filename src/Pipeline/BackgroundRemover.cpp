/*
 * Rmbg Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Pipeline/BackgroundRemover.hpp"

#include <chrono>
#include <span>
#include <stdexcept>
#include <utility>

#include <Rmbg/Composite/ParallelCompositor.hpp>
#include <Rmbg/Core/Errors.hpp>
#include <Rmbg/Crop/CropGeometry.hpp>
#include <Rmbg/Segmenter/NcnnSegmenter.hpp>
#include <Rmbg/Segmenter/OtsuThreshold.hpp>
#include <Rmbg/Segmenter/TensorConverter.hpp>

using namespace Rmbg::Image;

namespace Rmbg::Pipeline {

namespace {

using Clock = std::chrono::steady_clock;

inline long long elapsedMicros(Clock::time_point since) noexcept
{
	return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - since).count();
}

inline std::shared_ptr<const Logger::ILogger> requireLogger(std::shared_ptr<const Logger::ILogger> logger)
{
	if (!logger) {
		throw std::invalid_argument("BackgroundRemover requires a logger");
	}
	return logger;
}

} // anonymous namespace

BackgroundRemover::BackgroundRemover(std::shared_ptr<const Logger::ILogger> logger,
				     std::unique_ptr<Segmenter::ISegmenter> segmenter, Config::RemoverConfig config)
	: logger_(requireLogger(std::move(logger))),
	  config_(std::move(config)),
	  sigmoidTable_(Segmenter::SigmoidTable::shared()),
	  segmenter_(std::move(segmenter)),
	  scratchPool_(Memory::ScratchBufferPool::create(logger_, config_.poolMaxIdle)),
	  upsampler_(scratchPool_)
{
	if (!segmenter_) {
		throw std::invalid_argument("BackgroundRemover requires a segmenter");
	}

	const std::size_t inputSize = segmenter_->getInputSize();
	tensorPool_ = Memory::InferenceTensorPool::create(
		logger_, [inputSize] { return std::make_unique<Memory::InferenceTensors>(inputSize); },
		config_.poolMaxIdle);

	logger_->info("BackgroundRemover ready: input {}x{}, pool max idle {}", inputSize, inputSize,
		      config_.poolMaxIdle);
}

std::unique_ptr<BackgroundRemover> BackgroundRemover::create(std::shared_ptr<const Logger::ILogger> logger,
							     Config::RemoverConfig config)
{
	auto segmenter = std::make_unique<Segmenter::NcnnSegmenter>(config.model);
	return std::make_unique<BackgroundRemover>(std::move(logger), std::move(segmenter), std::move(config));
}

Mask BackgroundRemover::predictMask(const IImage &image)
{
	if (image.empty()) {
		throw std::invalid_argument("predictMask received an empty image");
	}

	const auto start = Clock::now();
	const Memory::InferenceTensorPool::Lease tensors = tensorPool_->acquire();
	const std::size_t size = tensors->size;

	Segmenter::fillInputTensor(image, size, config_.normalization, tensors->input);
	const long long preprocessUs = elapsedMicros(start);

	{
		std::lock_guard<std::mutex> lock(inferenceMutex_);
		segmenter_->infer(tensors->input.data(), tensors->output.data());
	}
	const long long inferenceUs = elapsedMicros(start) - preprocessUs;

	const std::span<const float> logits(tensors->output.data(), size * size);
	// Bins <= t form the low class, so the cutoff sits at the top of bin t.
	const float threshold = Segmenter::otsuThreshold(logits, sigmoidTable_) + 1.0f / 255.0f;

	Mask mask(size, size);
	Segmenter::binarizeLogits(logits, threshold, {mask.data(), mask.size()});

	logger_->debug("predictMask {}x{}: preprocess {}us, inference {}us, threshold {:.4f}, total {}us",
		       image.getWidth(), image.getHeight(), preprocessUs, inferenceUs, threshold, elapsedMicros(start));
	return mask;
}

Mask BackgroundRemover::predictFullMask(const IImage &image)
{
	const Mask mask = predictMask(image);

	const auto start = Clock::now();
	Mask refined = upsampler_.upsample(mask, image.getWidth(), image.getHeight());
	logger_->debug("upsample {}x{} -> {}x{}: {}us", mask.getWidth(), mask.getHeight(), refined.getWidth(),
		       refined.getHeight(), elapsedMicros(start));
	return refined;
}

PackedImage BackgroundRemover::removeBackground(const IImage &image)
{
	const Mask refined = predictFullMask(image);

	const auto start = Clock::now();
	PackedImage output =
		Composite::compositeOverBackground(image, refined, config_.background, config_.compositorWorkers);
	logger_->debug("composite {}x{}: {}us", image.getWidth(), image.getHeight(), elapsedMicros(start));
	return output;
}

PackedImage BackgroundRemover::smartCrop(const IImage &image, const Crop::CropConfig &cropConfig)
{
	const Mask mask = predictMask(image);

	const double scaleX = static_cast<double>(image.getWidth()) / static_cast<double>(mask.getWidth());
	const double scaleY = static_cast<double>(image.getHeight()) / static_cast<double>(mask.getHeight());

	PackedImage cropped = Crop::cropToObject(image, mask, cropConfig, scaleX, scaleY);
	logger_->debug("smartCrop {}x{} -> {}x{}", image.getWidth(), image.getHeight(), cropped.getWidth(),
		       cropped.getHeight());
	return cropped;
}

PackedImage BackgroundRemover::smartCropFromMask(const IImage &image, const Masking::MaskFunction &maskFunction,
						 const Crop::CropConfig &cropConfig) const
{
	if (!maskFunction) {
		throw std::invalid_argument("smartCropFromMask requires a mask function");
	}

	const auto start = Clock::now();
	const Mask mask = maskFunction(image);
	PackedImage cropped = Crop::cropToObject(image, mask, cropConfig, 1.0, 1.0);
	logger_->debug("smartCropFromMask {}x{} -> {}x{}: {}us", image.getWidth(), image.getHeight(),
		       cropped.getWidth(), cropped.getHeight(), elapsedMicros(start));
	return cropped;
}

} // namespace Rmbg::Pipeline
