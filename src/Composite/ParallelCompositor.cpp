/*
 * Rmbg Composite Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Composite/ParallelCompositor.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <thread>

#include <fmt/format.h>

#include <Rmbg/Core/Errors.hpp>

using namespace Rmbg::Image;

namespace Rmbg::Composite {

namespace {

inline std::uint8_t blend(std::uint8_t src, std::uint8_t bg, double alpha) noexcept
{
	return static_cast<std::uint8_t>(alpha * static_cast<double>(src) + (1.0 - alpha) * static_cast<double>(bg));
}

void compositeRows(const IImage &image, const Mask &mask, ColorRGBA background, PackedImage &output,
		   RowRange range)
{
	const std::size_t width = image.getWidth();
	const std::optional<PixelBufferView> buffer = image.getPixelBuffer();
	const bool packed = buffer && buffer->format != PixelFormat::Gray8;
	const bool bgra = packed && buffer->format == PixelFormat::BGRA;

	for (std::size_t y = range.begin; y < range.end; ++y) {
		const std::uint8_t *alphaRow = mask.row(y);
		std::uint8_t *dst = output.row(y);

		if (packed) {
			const std::uint8_t *src = buffer->row(y);
			for (std::size_t x = 0; x < width; ++x, src += 4, dst += 4) {
				const double alpha = static_cast<double>(alphaRow[x]) / 255.0;
				dst[0] = blend(src[bgra ? 2 : 0], background.r, alpha);
				dst[1] = blend(src[1], background.g, alpha);
				dst[2] = blend(src[bgra ? 0 : 2], background.b, alpha);
				dst[3] = kOpaque;
			}
		} else {
			for (std::size_t x = 0; x < width; ++x, dst += 4) {
				const double alpha = static_cast<double>(alphaRow[x]) / 255.0;
				const ColorRGBA c = image.getPixel(x, y);
				dst[0] = blend(c.r, background.r, alpha);
				dst[1] = blend(c.g, background.g, alpha);
				dst[2] = blend(c.b, background.b, alpha);
				dst[3] = kOpaque;
			}
		}
	}
}

} // anonymous namespace

std::vector<RowRange> partitionRows(std::size_t rowCount, std::size_t workerCount)
{
	if (workerCount == 0) {
		workerCount = std::max(1u, std::thread::hardware_concurrency());
	}
	workerCount = std::min(workerCount, rowCount);

	std::vector<RowRange> ranges;
	ranges.reserve(workerCount);

	const std::size_t base = workerCount ? rowCount / workerCount : 0;
	const std::size_t extra = workerCount ? rowCount % workerCount : 0;
	std::size_t begin = 0;
	for (std::size_t i = 0; i < workerCount; ++i) {
		const std::size_t end = begin + base + (i < extra ? 1 : 0);
		ranges.push_back({begin, end});
		begin = end;
	}
	return ranges;
}

PackedImage compositeOverBackground(const IImage &image, const Mask &mask, ColorRGBA background,
				    std::size_t workerCount)
{
	if (mask.getWidth() != image.getWidth() || mask.getHeight() != image.getHeight()) {
		throw Core::InvalidMaskError(fmt::format("mask is {}x{} but image is {}x{}", mask.getWidth(),
							 mask.getHeight(), image.getWidth(), image.getHeight()));
	}

	PackedImage output(image.getWidth(), image.getHeight(), PixelFormat::RGBA);
	if (image.empty()) {
		return output;
	}

	const std::vector<RowRange> ranges = partitionRows(image.getHeight(), workerCount);

	std::vector<std::future<void>> workers;
	workers.reserve(ranges.size());
	for (const RowRange &range : ranges) {
		workers.push_back(std::async(std::launch::async, compositeRows, std::cref(image), std::cref(mask),
					     background, std::ref(output), range));
	}

	// Wait for every worker before rethrowing so none outlives output.
	std::exception_ptr failure;
	for (std::future<void> &worker : workers) {
		try {
			worker.get();
		} catch (const std::exception &) {
			if (!failure) {
				failure = std::current_exception();
			}
		}
	}
	if (failure) {
		std::rethrow_exception(failure);
	}

	return output;
}

} // namespace Rmbg::Composite
