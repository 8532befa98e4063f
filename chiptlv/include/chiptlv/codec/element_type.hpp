/*
 * File: element_type.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "chiptlv/codec/errors.hpp"
#include "chiptlv/codec/length_field.hpp"

namespace chiptlv::codec {

	// Lower five bits of the control byte. Values are wire constants.
	enum class element_type : std::uint8_t {
		int8              = 0x00,
		int16             = 0x01,
		int32             = 0x02,
		int64             = 0x03,
		uint8             = 0x04,
		uint16            = 0x05,
		uint32            = 0x06,
		uint64            = 0x07,
		boolean_false     = 0x08,
		boolean_true      = 0x09,
		float32           = 0x0A,
		float64           = 0x0B,
		utf8_string_1     = 0x0C,
		utf8_string_2     = 0x0D,
		utf8_string_4     = 0x0E,
		utf8_string_8     = 0x0F,
		byte_string_1     = 0x10,
		byte_string_2     = 0x11,
		byte_string_4     = 0x12,
		byte_string_8     = 0x13,
		null              = 0x14,
		structure         = 0x15,
		array             = 0x16,
		list              = 0x17,
		end_of_container  = 0x18,
	};

	constexpr static const std::uint8_t TYPE_CODE_MASK = 0x1F;

	enum class container_kind : std::uint8_t {
		structure = static_cast<std::uint8_t>(element_type::structure),
		array = static_cast<std::uint8_t>(element_type::array),
		list = static_cast<std::uint8_t>(element_type::list),
	};

	struct signed_integer {
		std::uint8_t width = 1;
		bool operator == (const signed_integer&) const = default;
	};

	struct unsigned_integer {
		std::uint8_t width = 1;
		bool operator == (const unsigned_integer&) const = default;
	};

	struct boolean {
		bool value = false;
		bool operator == (const boolean&) const = default;
	};

	struct floating_point {
		std::uint8_t width = 4;
		bool operator == (const floating_point&) const = default;
	};

	struct null_value {
		bool operator == (const null_value&) const = default;
	};

	struct utf8_string {
		field_size length_field = field_size::one;
		bool operator == (const utf8_string&) const = default;
	};

	struct byte_string {
		field_size length_field = field_size::one;
		bool operator == (const byte_string&) const = default;
	};

	struct container {
		container_kind kind = container_kind::structure;
		bool operator == (const container&) const = default;
	};

	struct end_of_container {
		bool operator == (const end_of_container&) const = default;
	};

	using semantic_type = std::variant<signed_integer, unsigned_integer, boolean,
		floating_point, null_value, utf8_string, byte_string, container, end_of_container>;

	namespace types {

		template <typename>
		inline constexpr bool always_false_v = false;

		namespace detail {
			constexpr inline std::uint8_t width_from_index(std::uint8_t idx) noexcept {
				return static_cast<std::uint8_t>(1u << idx);
			}

			constexpr inline std::uint8_t index_from_width(std::uint8_t width) noexcept {
				switch (width) {
				case 1: return 0;
				case 2: return 1;
				case 4: return 2;
				default: return 3;
				}
			}

			constexpr inline std::uint8_t index_from_field(field_size fs) noexcept {
				return index_from_width(static_cast<std::uint8_t>(fs));
			}
		}

		inline semantic_type decode(std::uint8_t type_code) {
			if (type_code > static_cast<std::uint8_t>(element_type::end_of_container)) {
				throw tlv_error(errc::invalid_type, std::format("unassigned element type 0x{:02X}", type_code));
			}
			const auto et = static_cast<element_type>(type_code);
			switch (et) {
			case element_type::int8:
			case element_type::int16:
			case element_type::int32:
			case element_type::int64:
				return signed_integer{ detail::width_from_index(type_code & 0x03) };
			case element_type::uint8:
			case element_type::uint16:
			case element_type::uint32:
			case element_type::uint64:
				return unsigned_integer{ detail::width_from_index(type_code & 0x03) };
			case element_type::boolean_false:
				return boolean{ false };
			case element_type::boolean_true:
				return boolean{ true };
			case element_type::float32:
				return floating_point{ 4 };
			case element_type::float64:
				return floating_point{ 8 };
			case element_type::utf8_string_1:
			case element_type::utf8_string_2:
			case element_type::utf8_string_4:
			case element_type::utf8_string_8:
				return utf8_string{ static_cast<field_size>(detail::width_from_index(type_code & 0x03)) };
			case element_type::byte_string_1:
			case element_type::byte_string_2:
			case element_type::byte_string_4:
			case element_type::byte_string_8:
				return byte_string{ static_cast<field_size>(detail::width_from_index(type_code & 0x03)) };
			case element_type::null:
				return null_value{};
			case element_type::structure:
				return container{ container_kind::structure };
			case element_type::array:
				return container{ container_kind::array };
			case element_type::list:
				return container{ container_kind::list };
			case element_type::end_of_container:
				return end_of_container{};
			}
			throw tlv_error(errc::invalid_type, std::format("unassigned element type 0x{:02X}", type_code));
		}

		// Inverse of decode(). Widths outside {1,2,4,8} (or {4,8} for floats) are
		// not representable and must not be constructed.
		inline element_type encode(const semantic_type& st) noexcept {
			return std::visit([](const auto& v) -> element_type {
				using T = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<T, signed_integer>) {
					return static_cast<element_type>(
						static_cast<std::uint8_t>(element_type::int8) + detail::index_from_width(v.width));
				}
				else if constexpr (std::is_same_v<T, unsigned_integer>) {
					return static_cast<element_type>(
						static_cast<std::uint8_t>(element_type::uint8) + detail::index_from_width(v.width));
				}
				else if constexpr (std::is_same_v<T, boolean>) {
					return v.value ? element_type::boolean_true : element_type::boolean_false;
				}
				else if constexpr (std::is_same_v<T, floating_point>) {
					return v.width == 4 ? element_type::float32 : element_type::float64;
				}
				else if constexpr (std::is_same_v<T, null_value>) {
					return element_type::null;
				}
				else if constexpr (std::is_same_v<T, utf8_string>) {
					return static_cast<element_type>(
						static_cast<std::uint8_t>(element_type::utf8_string_1) + detail::index_from_field(v.length_field));
				}
				else if constexpr (std::is_same_v<T, byte_string>) {
					return static_cast<element_type>(
						static_cast<std::uint8_t>(element_type::byte_string_1) + detail::index_from_field(v.length_field));
				}
				else if constexpr (std::is_same_v<T, container>) {
					return static_cast<element_type>(v.kind);
				}
				else if constexpr (std::is_same_v<T, end_of_container>) {
					return element_type::end_of_container;
				}
				else {
					static_assert(always_false_v<T>, "unhandled element type");
				}
			}, st);
		}

		inline bool is_container(const semantic_type& st) noexcept {
			return std::holds_alternative<container>(st);
		}

		inline bool is_end_of_container(const semantic_type& st) noexcept {
			return std::holds_alternative<end_of_container>(st);
		}

		inline bool is_specified_length(const semantic_type& st) noexcept {
			return std::holds_alternative<utf8_string>(st) || std::holds_alternative<byte_string>(st);
		}

		// Everything that is not a container, its terminator or a string has a
		// length implied by the type code alone.
		inline bool is_predetermined_length(const semantic_type& st) noexcept {
			return std::holds_alternative<signed_integer>(st)
				|| std::holds_alternative<unsigned_integer>(st)
				|| std::holds_alternative<boolean>(st)
				|| std::holds_alternative<floating_point>(st)
				|| std::holds_alternative<null_value>(st);
		}

		// Only meaningful for predetermined-length primitives; 0 otherwise.
		inline std::size_t value_octet_count(const semantic_type& st) noexcept {
			return std::visit([](const auto& v) -> std::size_t {
				using T = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<T, signed_integer> || std::is_same_v<T, unsigned_integer>
					|| std::is_same_v<T, floating_point>) {
					return v.width;
				}
				else {
					return 0;
				}
			}, st);
		}

		// Only meaningful for specified-length primitives.
		inline std::optional<field_size> length_field_size(const semantic_type& st) noexcept {
			if (const auto* s = std::get_if<utf8_string>(&st)) {
				return s->length_field;
			}
			if (const auto* b = std::get_if<byte_string>(&st)) {
				return b->length_field;
			}
			return std::nullopt;
		}

		inline const char* to_string(container_kind kind) noexcept {
			switch (kind) {
			case container_kind::structure: return "structure";
			case container_kind::array:     return "array";
			case container_kind::list:      return "list";
			}
			return "container";
		}

		inline std::string to_string(const semantic_type& st) {
			return std::visit([](const auto& v) -> std::string {
				using T = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<T, signed_integer>) {
					return std::format("i{}", v.width * 8);
				}
				else if constexpr (std::is_same_v<T, unsigned_integer>) {
					return std::format("u{}", v.width * 8);
				}
				else if constexpr (std::is_same_v<T, boolean>) {
					return "bool";
				}
				else if constexpr (std::is_same_v<T, floating_point>) {
					return std::format("f{}", v.width * 8);
				}
				else if constexpr (std::is_same_v<T, null_value>) {
					return "null";
				}
				else if constexpr (std::is_same_v<T, utf8_string>) {
					return "utf8";
				}
				else if constexpr (std::is_same_v<T, byte_string>) {
					return "bytes";
				}
				else if constexpr (std::is_same_v<T, container>) {
					return to_string(v.kind);
				}
				else if constexpr (std::is_same_v<T, end_of_container>) {
					return "end_of_container";
				}
				else {
					static_assert(always_false_v<T>, "unhandled element type");
				}
			}, st);
		}

	} // namespace types

} // namespace chiptlv::codec
