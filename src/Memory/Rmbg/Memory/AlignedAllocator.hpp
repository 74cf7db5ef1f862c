/*
 * Rmbg Memory Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace Rmbg::Memory {

/**
 * @brief Alignment used for every pixel, mask and tensor buffer.
 *
 * 32 bytes keeps rows loadable with 256-bit vector instructions.
 */
constexpr std::size_t kBufferAlignment = 32;

/**
 * @brief STL-compatible allocator returning storage aligned to a fixed boundary.
 *
 * @tparam T The value type to allocate.
 * @tparam Alignment A power of two, at least alignof(std::max_align_t).
 */
template<typename T, std::size_t Alignment = kBufferAlignment> class AlignedAllocator {
	static_assert(Alignment >= alignof(std::max_align_t), "Alignment must be at least alignof(std::max_align_t)");
	static_assert((Alignment & (Alignment - 1)) == 0, "Alignment must be a power of two");

public:
	using value_type = T;

	template<class U> struct rebind {
		using other = AlignedAllocator<U, Alignment>;
	};

	AlignedAllocator() noexcept = default;

	template<class U> AlignedAllocator(const AlignedAllocator<U, Alignment> &) noexcept {}

	T *allocate(std::size_t n)
	{
		if (n > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
			throw std::bad_array_new_length();
		}

		return static_cast<T *>(::operator new(n * sizeof(T), std::align_val_t(Alignment)));
	}

	void deallocate(T *p, std::size_t) noexcept { ::operator delete(p, std::align_val_t(Alignment)); }

	template<typename U> bool operator==(const AlignedAllocator<U, Alignment> &) const noexcept { return true; }

	template<typename U> bool operator!=(const AlignedAllocator<U, Alignment> &) const noexcept { return false; }
};

using ByteBuffer = std::vector<std::uint8_t, AlignedAllocator<std::uint8_t>>;
using FloatBuffer = std::vector<float, AlignedAllocator<float>>;

} // namespace Rmbg::Memory
