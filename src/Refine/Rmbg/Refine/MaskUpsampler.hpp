/*
 * Rmbg Refine Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include <Rmbg/Image/Mask.hpp>
#include <Rmbg/Memory/ScratchBuffers.hpp>

namespace Rmbg::Refine {

constexpr std::size_t kBoxBlurWindow = 5;

/**
 * @brief Bilinear resize between flat row-major 8-bit grids with pixel centers aligned.
 */
void resizeBilinear(const std::uint8_t *src, std::size_t srcWidth, std::size_t srcHeight, std::uint8_t *dst,
		    std::size_t dstWidth, std::size_t dstHeight) noexcept;

/**
 * @brief Separable 5-tap box blur. The horizontal pass goes to hPass, the vertical pass to dst.
 *
 * Samples past the edge are clamped to the nearest valid index. dst may equal src.
 */
void boxBlur5(const std::uint8_t *src, std::uint8_t *hPass, std::uint8_t *dst, std::size_t width,
	      std::size_t height) noexcept;

/**
 * @brief Brings an inference-resolution mask to a target resolution and softens its edges.
 *
 * Thread-safe: every call borrows its own scratch buffers from the shared pool.
 */
class MaskUpsampler {
public:
	explicit MaskUpsampler(std::shared_ptr<Memory::ScratchBufferPool> pool);

	/**
	 * @throw Rmbg::Core::InvalidMaskError If mask is empty.
	 * @throw std::invalid_argument If the target size is zero.
	 */
	Image::Mask upsample(const Image::Mask &mask, std::size_t targetWidth, std::size_t targetHeight) const;

private:
	const std::shared_ptr<Memory::ScratchBufferPool> pool_;
};

} // namespace Rmbg::Refine
