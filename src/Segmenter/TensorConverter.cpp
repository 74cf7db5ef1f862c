/*
 * Rmbg Segmenter Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Segmenter/TensorConverter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace Rmbg::Image;

namespace Rmbg::Segmenter {

namespace {

struct SampleWeights {
	std::size_t i0, i1;
	float w0, w1;
};

/**
 * @brief Maps destination index to the two nearest source indices (pixel centers aligned).
 */
inline SampleWeights sampleWeights(std::size_t dst, std::size_t dstExtent, std::size_t srcExtent) noexcept
{
	const float scale = static_cast<float>(srcExtent) / static_cast<float>(dstExtent);
	float pos = (static_cast<float>(dst) + 0.5f) * scale - 0.5f;
	pos = std::clamp(pos, 0.0f, static_cast<float>(srcExtent - 1));

	const auto i0 = static_cast<std::size_t>(pos);
	const std::size_t i1 = std::min(i0 + 1, srcExtent - 1);
	const float frac = pos - static_cast<float>(i0);
	return {i0, i1, 1.0f - frac, frac};
}

/**
 * @brief Reads R, G, B of one pixel as floats through the fastest available path.
 */
class RgbReader {
public:
	explicit RgbReader(const IImage &image) : image_(image), buffer_(image.getPixelBuffer())
	{
		if (buffer_) {
			switch (buffer_->format) {
			case PixelFormat::BGRA:
				r_ = 2;
				g_ = 1;
				b_ = 0;
				bpp_ = 4;
				break;
			case PixelFormat::Gray8:
				r_ = g_ = b_ = 0;
				bpp_ = 1;
				break;
			default:
				r_ = 0;
				g_ = 1;
				b_ = 2;
				bpp_ = 4;
				break;
			}
		}
	}

	void read(std::size_t x, std::size_t y, float rgb[3]) const
	{
		if (buffer_) {
			const std::uint8_t *p = buffer_->row(y) + x * bpp_;
			rgb[0] = p[r_];
			rgb[1] = p[g_];
			rgb[2] = p[b_];
		} else {
			const ColorRGBA c = image_.getPixel(x, y);
			rgb[0] = c.r;
			rgb[1] = c.g;
			rgb[2] = c.b;
		}
	}

private:
	const IImage &image_;
	const std::optional<PixelBufferView> buffer_;
	std::size_t r_ = 0, g_ = 1, b_ = 2, bpp_ = 4;
};

} // anonymous namespace

void fillInputTensor(const IImage &image, std::size_t size, const NormalizationParams &normalization,
		     std::span<float> chw)
{
	if (image.empty()) {
		throw std::invalid_argument("fillInputTensor received an empty image");
	}
	if (size == 0 || chw.size() < 3 * size * size) {
		throw std::invalid_argument("fillInputTensor destination is smaller than 3 * size * size");
	}

	const std::size_t planeSize = size * size;
	float *planes[3] = {chw.data(), chw.data() + planeSize, chw.data() + 2 * planeSize};

	float scale[3];
	float offset[3];
	for (std::size_t c = 0; c < 3; ++c) {
		scale[c] = 1.0f / (255.0f * normalization.std[c]);
		offset[c] = normalization.mean[c] / normalization.std[c];
	}

	const RgbReader reader(image);
	const std::size_t srcWidth = image.getWidth();
	const std::size_t srcHeight = image.getHeight();

	for (std::size_t y = 0; y < size; ++y) {
		const SampleWeights sy = sampleWeights(y, size, srcHeight);
		for (std::size_t x = 0; x < size; ++x) {
			const SampleWeights sx = sampleWeights(x, size, srcWidth);

			float p00[3], p10[3], p01[3], p11[3];
			reader.read(sx.i0, sy.i0, p00);
			reader.read(sx.i1, sy.i0, p10);
			reader.read(sx.i0, sy.i1, p01);
			reader.read(sx.i1, sy.i1, p11);

			const std::size_t index = y * size + x;
			for (std::size_t c = 0; c < 3; ++c) {
				const float top = p00[c] * sx.w0 + p10[c] * sx.w1;
				const float bottom = p01[c] * sx.w0 + p11[c] * sx.w1;
				const float value = top * sy.w0 + bottom * sy.w1;
				planes[c][index] = value * scale[c] - offset[c];
			}
		}
	}
}

void binarizeLogits(std::span<const float> logits, float threshold, std::span<std::uint8_t> mask)
{
	if (mask.size() < logits.size()) {
		throw std::invalid_argument("binarizeLogits mask is smaller than the logit field");
	}

	for (std::size_t i = 0; i < logits.size(); ++i) {
		const float probability = 1.0f / (1.0f + std::exp(-logits[i]));
		mask[i] = probability > threshold ? 255 : 0;
	}
}

} // namespace Rmbg::Segmenter
