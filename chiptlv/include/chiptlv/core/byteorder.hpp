/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <type_traits>

#include "chiptlv/core/bytes.hpp"

namespace chiptlv::core::byteorder {

	template <typename T>
	concept Word = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
		((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept SignedWord = Word<T> && std::is_signed_v<T>;

	template <typename T>
	concept UnsignedWord = Word<T> && std::is_unsigned_v<T>;

	template <typename T>
	concept FloatWord = std::is_floating_point_v<T> &&
		((sizeof(T) == sizeof(std::uint32_t)) || (sizeof(T) == sizeof(std::uint64_t)));

	template <typename T>
	concept Scalar = Word<T> || FloatWord<T>;

	template <UnsignedWord WordT>
	inline WordT le_to_native_unsigned(const core::byte* mem) {
		if constexpr (sizeof(WordT) == 1) {
			return static_cast<WordT>(mem[0]);
		}
		else if constexpr (std::endian::native != std::endian::little) {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				result |= static_cast<WordT>(static_cast<WordT>(mem[i]) << (8 * i));
			}
			return result;
		}
		else {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
	}

	template <UnsignedWord WordT>
	inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		if constexpr (sizeof(WordT) == 1) {
			mem[0] = static_cast<core::byte>(val);
		}
		else if constexpr (std::endian::native != std::endian::little) {
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				mem[i] = static_cast<core::byte>((val >> (8 * i)) & 0xFF);
			}
		}
		else {
			std::memcpy(mem, &val, sizeof(WordT));
		}
	}

	template <SignedWord WordT>
	inline WordT le_to_native_signed(const core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const unsigned_type uns = le_to_native_unsigned<unsigned_type>(mem);
		return std::bit_cast<WordT>(uns);
	}

	template <SignedWord WordT>
	inline void native_to_le_signed(WordT val, core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const unsigned_type uns = std::bit_cast<unsigned_type>(val);
		native_to_le_unsigned<unsigned_type>(uns, mem);
	}

	template <FloatWord FloatT>
	inline FloatT le_to_native_float(const core::byte* mem) {
		using bits_type = std::conditional_t<sizeof(FloatT) == 4, std::uint32_t, std::uint64_t>;
		return std::bit_cast<FloatT>(le_to_native_unsigned<bits_type>(mem));
	}

	template <FloatWord FloatT>
	inline void native_to_le_float(FloatT val, core::byte* mem) {
		using bits_type = std::conditional_t<sizeof(FloatT) == 4, std::uint32_t, std::uint64_t>;
		native_to_le_unsigned<bits_type>(std::bit_cast<bits_type>(val), mem);
	}

	template <Scalar T>
	inline T le_to_native(const core::byte* mem) {
		if constexpr (FloatWord<T>) {
			return le_to_native_float<T>(mem);
		}
		else if constexpr (std::is_unsigned_v<T>) {
			return le_to_native_unsigned<T>(mem);
		}
		else {
			return le_to_native_signed<T>(mem);
		}
	}

	template <Scalar T>
	inline void native_to_le(T val, core::byte* mem) {
		if constexpr (FloatWord<T>) {
			native_to_le_float<T>(val, mem);
		}
		else if constexpr (std::is_unsigned_v<T>) {
			native_to_le_unsigned<T>(val, mem);
		}
		else {
			native_to_le_signed<T>(val, mem);
		}
	}

} // namespace chiptlv::core::byteorder
