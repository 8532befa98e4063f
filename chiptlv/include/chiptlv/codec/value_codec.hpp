/*
 * File: value_codec.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <tuple>

#include "chiptlv/core/bytes.hpp"
#include "chiptlv/core/byteorder.hpp"
#include "chiptlv/codec/element_type.hpp"

namespace chiptlv::codec {

	namespace byteorder = core::byteorder;

	// Maps a C++ value type onto its fixed-width element type and wire bytes.
	template <typename T>
	struct value_codec;

	template <byteorder::Word WordT>
	struct integer_codec {

		using value_type = WordT;

		static semantic_type type() noexcept {
			if constexpr (std::is_signed_v<value_type>) {
				return signed_integer{ static_cast<std::uint8_t>(sizeof(value_type)) };
			}
			else {
				return unsigned_integer{ static_cast<std::uint8_t>(sizeof(value_type)) };
			}
		}

		static std::size_t store(value_type val, core::byte* where) {
			byteorder::native_to_le<value_type>(val, where);
			return sizeof(value_type);
		}

		static std::tuple<value_type, std::size_t> load(const core::byte* where) {
			const auto val = byteorder::le_to_native<value_type>(where);
			return { val, sizeof(value_type) };
		}

		constexpr static std::size_t size() noexcept {
			return sizeof(value_type);
		}
	};

	template <byteorder::FloatWord FloatT>
	struct float_codec {

		using value_type = FloatT;

		static semantic_type type() noexcept {
			return floating_point{ static_cast<std::uint8_t>(sizeof(value_type)) };
		}

		static std::size_t store(value_type val, core::byte* where) {
			byteorder::native_to_le<value_type>(val, where);
			return sizeof(value_type);
		}

		static std::tuple<value_type, std::size_t> load(const core::byte* where) {
			const auto val = byteorder::le_to_native<value_type>(where);
			return { val, sizeof(value_type) };
		}

		constexpr static std::size_t size() noexcept {
			return sizeof(value_type);
		}
	};

	template <>
	struct value_codec<std::int8_t> : public integer_codec<std::int8_t> {};
	template <>
	struct value_codec<std::int16_t> : public integer_codec<std::int16_t> {};
	template <>
	struct value_codec<std::int32_t> : public integer_codec<std::int32_t> {};
	template <>
	struct value_codec<std::int64_t> : public integer_codec<std::int64_t> {};

	template <>
	struct value_codec<std::uint8_t> : public integer_codec<std::uint8_t> {};
	template <>
	struct value_codec<std::uint16_t> : public integer_codec<std::uint16_t> {};
	template <>
	struct value_codec<std::uint32_t> : public integer_codec<std::uint32_t> {};
	template <>
	struct value_codec<std::uint64_t> : public integer_codec<std::uint64_t> {};

	template <>
	struct value_codec<float> : public float_codec<float> {};
	template <>
	struct value_codec<double> : public float_codec<double> {};

	template <typename T>
	concept FixedWidthValue = requires(T v, core::byte* out, const core::byte* in) {
		{ value_codec<T>::type() } -> std::same_as<semantic_type>;
		{ value_codec<T>::store(v, out) } -> std::same_as<std::size_t>;
		{ value_codec<T>::load(in) } -> std::same_as<std::tuple<T, std::size_t>>;
	};

} // namespace chiptlv::codec
