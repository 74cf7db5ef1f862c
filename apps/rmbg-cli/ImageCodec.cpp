/*
 * Rmbg Command Line Tool
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ImageCodec.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

using namespace Rmbg::Image;

namespace Rmbg::Cli {

PackedImage readImage(const std::filesystem::path &path)
{
	cv::Mat decoded = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
	if (decoded.empty()) {
		throw std::runtime_error(fmt::format("cannot decode image {}", path.string()));
	}

	if (decoded.depth() == CV_16U) {
		decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);
	} else if (decoded.depth() != CV_8U) {
		throw std::runtime_error(fmt::format("unsupported pixel depth in {}", path.string()));
	}

	cv::Mat bgra;
	switch (decoded.channels()) {
	case 1:
		cv::cvtColor(decoded, bgra, cv::COLOR_GRAY2BGRA);
		break;
	case 3:
		cv::cvtColor(decoded, bgra, cv::COLOR_BGR2BGRA);
		break;
	case 4:
		bgra = decoded;
		break;
	default:
		throw std::runtime_error(fmt::format("unsupported channel count {} in {}", decoded.channels(),
						     path.string()));
	}

	return PackedImage::fromBuffer(bgra.data, static_cast<std::size_t>(bgra.cols),
				       static_cast<std::size_t>(bgra.rows), bgra.step[0], PixelFormat::BGRA);
}

void writeImage(const std::filesystem::path &path, const PackedImage &image)
{
	const cv::Mat view(static_cast<int>(image.getHeight()), static_cast<int>(image.getWidth()), CV_8UC4,
			   const_cast<std::uint8_t *>(image.data()), image.getStride());

	cv::Mat bgra;
	if (image.getFormat() == PixelFormat::RGBA) {
		cv::cvtColor(view, bgra, cv::COLOR_RGBA2BGRA);
	} else {
		bgra = view;
	}

	if (!cv::imwrite(path.string(), bgra)) {
		throw std::runtime_error(fmt::format("cannot encode image {}", path.string()));
	}
}

void writeMask(const std::filesystem::path &path, const Mask &mask)
{
	const cv::Mat view(static_cast<int>(mask.getHeight()), static_cast<int>(mask.getWidth()), CV_8UC1,
			   const_cast<std::uint8_t *>(mask.data()), mask.getWidth());

	if (!cv::imwrite(path.string(), view)) {
		throw std::runtime_error(fmt::format("cannot encode mask {}", path.string()));
	}
}

} // namespace Rmbg::Cli
