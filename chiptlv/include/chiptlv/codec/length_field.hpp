/*
 * File: length_field.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <limits>
#include <tuple>

#include "chiptlv/core/bytes.hpp"
#include "chiptlv/core/byteorder.hpp"
#include "chiptlv/core/debug.hpp"
#include "chiptlv/codec/errors.hpp"

namespace chiptlv::codec {

	using core::byte;
	using core::byte_view;

	// Width of the length prefix of a string element. The value is the octet count.
	enum class field_size : std::uint8_t {
		one = 1,
		two = 2,
		four = 4,
		eight = 8,
	};

	namespace length_field {

		namespace byteorder = core::byteorder;

		constexpr inline std::size_t octet_count(field_size width) noexcept {
			return static_cast<std::size_t>(width);
		}

		constexpr inline std::uint64_t max_length(field_size width) noexcept {
			switch (width) {
			case field_size::one:   return std::numeric_limits<std::uint8_t>::max();
			case field_size::two:   return std::numeric_limits<std::uint16_t>::max();
			case field_size::four:  return std::numeric_limits<std::uint32_t>::max();
			case field_size::eight: return std::numeric_limits<std::uint64_t>::max();
			}
			return 0;
		}

		// Canonical encoders always use this; decoders accept any width.
		constexpr inline field_size pick_width(std::uint64_t byte_length) noexcept {
			if (byte_length <= max_length(field_size::one)) {
				return field_size::one;
			}
			if (byte_length <= max_length(field_size::two)) {
				return field_size::two;
			}
			if (byte_length <= max_length(field_size::four)) {
				return field_size::four;
			}
			return field_size::eight;
		}

		inline std::tuple<std::uint64_t, byte_view> read(field_size width, byte_view bytes) {
			const auto need = octet_count(width);
			if (bytes.size() < need) {
				throw_under_run("length field", need, bytes.size());
			}
			std::uint64_t length = 0;
			switch (width) {
			case field_size::one:
				length = byteorder::le_to_native<std::uint8_t>(bytes.data());
				break;
			case field_size::two:
				length = byteorder::le_to_native<std::uint16_t>(bytes.data());
				break;
			case field_size::four:
				length = byteorder::le_to_native<std::uint32_t>(bytes.data());
				break;
			case field_size::eight:
				length = byteorder::le_to_native<std::uint64_t>(bytes.data());
				break;
			}
			return { length, bytes.subspan(need) };
		}

		// `where` must have room for octet_count(width) bytes.
		inline std::size_t write(field_size width, std::uint64_t length, byte* where) {
			CHIPTLV_ASSERT(length <= max_length(width), "length does not fit the field");
			switch (width) {
			case field_size::one:
				byteorder::native_to_le<std::uint8_t>(static_cast<std::uint8_t>(length), where);
				break;
			case field_size::two:
				byteorder::native_to_le<std::uint16_t>(static_cast<std::uint16_t>(length), where);
				break;
			case field_size::four:
				byteorder::native_to_le<std::uint32_t>(static_cast<std::uint32_t>(length), where);
				break;
			case field_size::eight:
				byteorder::native_to_le<std::uint64_t>(length, where);
				break;
			}
			return octet_count(width);
		}

	} // namespace length_field

} // namespace chiptlv::codec
