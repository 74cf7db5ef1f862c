/*
 * Rmbg Pipeline Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <mutex>

#include <Rmbg/Config/RemoverConfig.hpp>
#include <Rmbg/Crop/CropConfig.hpp>
#include <Rmbg/Image/IImage.hpp>
#include <Rmbg/Image/Mask.hpp>
#include <Rmbg/Image/PackedImage.hpp>
#include <Rmbg/Logger/ILogger.hpp>
#include <Rmbg/Masking/MaskGenerator.hpp>
#include <Rmbg/Memory/ScratchBuffers.hpp>
#include <Rmbg/Refine/MaskUpsampler.hpp>
#include <Rmbg/Segmenter/ISegmenter.hpp>
#include <Rmbg/Segmenter/SigmoidTable.hpp>

namespace Rmbg::Pipeline {

/**
 * @class BackgroundRemover
 * @brief Background removal and subject cropping around a salient-object model.
 *
 * All operations may be called concurrently. Calls into the segmenter are
 * serialized by one mutex; everything else runs on the calling thread with
 * pooled buffers, except compositing which fans out over worker threads.
 */
class BackgroundRemover {
public:
	/**
	 * @throw std::invalid_argument If logger or segmenter is null.
	 */
	BackgroundRemover(std::shared_ptr<const Logger::ILogger> logger, std::unique_ptr<Segmenter::ISegmenter> segmenter,
			  Config::RemoverConfig config);

	/**
	 * @brief Builds a remover backed by the ncnn model named in config.
	 * @throw Rmbg::Core::InferenceError If the model cannot be loaded.
	 */
	static std::unique_ptr<BackgroundRemover> create(std::shared_ptr<const Logger::ILogger> logger,
							 Config::RemoverConfig config);

	~BackgroundRemover() noexcept = default;

	BackgroundRemover(const BackgroundRemover &) = delete;
	BackgroundRemover &operator=(const BackgroundRemover &) = delete;
	BackgroundRemover(BackgroundRemover &&) = delete;
	BackgroundRemover &operator=(BackgroundRemover &&) = delete;

	/**
	 * @brief Binary object mask at the model's input resolution.
	 */
	Image::Mask predictMask(const Image::IImage &image);

	/**
	 * @brief Composites the subject over the configured background color.
	 */
	Image::PackedImage removeBackground(const Image::IImage &image);

	/**
	 * @brief predictMask upsampled to the image size.
	 */
	Image::Mask predictFullMask(const Image::IImage &image);

	/**
	 * @throw Rmbg::Core::NoObjectDetectedError
	 */
	Image::PackedImage smartCrop(const Image::IImage &image, const Crop::CropConfig &cropConfig);
	Image::PackedImage smartCrop(const Image::IImage &image) { return smartCrop(image, config_.crop); }

	/**
	 * @brief Crops using any mask source at the image's own resolution. Never runs inference.
	 * @throw Rmbg::Core::NoObjectDetectedError
	 */
	Image::PackedImage smartCropFromMask(const Image::IImage &image, const Masking::MaskFunction &maskFunction,
					     const Crop::CropConfig &cropConfig) const;

	const Config::RemoverConfig &getConfig() const noexcept { return config_; }

private:
	const std::shared_ptr<const Logger::ILogger> logger_;
	const Config::RemoverConfig config_;
	const Segmenter::SigmoidTable &sigmoidTable_;

	std::unique_ptr<Segmenter::ISegmenter> segmenter_;
	std::mutex inferenceMutex_;

	std::shared_ptr<Memory::InferenceTensorPool> tensorPool_;
	std::shared_ptr<Memory::ScratchBufferPool> scratchPool_;
	Refine::MaskUpsampler upsampler_;
};

} // namespace Rmbg::Pipeline
