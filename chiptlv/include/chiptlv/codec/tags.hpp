/*
 * File: tags.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>

#include "chiptlv/core/bytes.hpp"
#include "chiptlv/core/byteorder.hpp"
#include "chiptlv/codec/errors.hpp"

namespace chiptlv::codec {

	using core::byte;
	using core::byte_view;

	// Upper three bits of the control byte.
	enum class tag_control : std::uint8_t {
		anonymous          = 0x00,
		context_specific   = 0x20,
		common_profile_2   = 0x40,
		common_profile_4   = 0x60,
		implicit_profile_2 = 0x80,
		implicit_profile_4 = 0xA0,
		fully_qualified_6  = 0xC0,
		fully_qualified_8  = 0xE0,
	};

	constexpr static const std::uint8_t TAG_CONTROL_MASK = 0xE0;
	constexpr static const std::size_t MAX_TAG_OCTETS = 8;

	// Width of the tag number carried by the profile tag forms.
	enum class tag_number_size : std::uint8_t {
		two = 2,
		four = 4,
	};

	struct anonymous_tag {
		bool operator == (const anonymous_tag&) const = default;
	};

	struct context_tag {
		std::uint8_t number = 0;
		bool operator == (const context_tag&) const = default;
	};

	struct common_profile_tag {
		tag_number_size size = tag_number_size::two;
		std::uint32_t number = 0;
		bool operator == (const common_profile_tag&) const = default;
	};

	struct implicit_profile_tag {
		tag_number_size size = tag_number_size::two;
		std::uint32_t number = 0;
		bool operator == (const implicit_profile_tag&) const = default;
	};

	struct fully_qualified_tag {
		std::uint16_t vendor_id = 0;
		std::uint16_t profile_number = 0;
		tag_number_size size = tag_number_size::two;
		std::uint32_t number = 0;
		bool operator == (const fully_qualified_tag&) const = default;
	};

	using tag = std::variant<anonymous_tag, context_tag, common_profile_tag,
		implicit_profile_tag, fully_qualified_tag>;

	namespace tags {

		namespace byteorder = core::byteorder;

		template <typename>
		inline constexpr bool always_false_v = false;

		constexpr inline tag_number_size number_size_for(std::uint32_t number) noexcept {
			return number <= 0xFFFF ? tag_number_size::two : tag_number_size::four;
		}

		inline tag anonymous() { return anonymous_tag{}; }
		inline tag context(std::uint8_t number) { return context_tag{ number }; }
		inline tag common_profile(std::uint32_t number) {
			return common_profile_tag{ number_size_for(number), number };
		}
		inline tag implicit_profile(std::uint32_t number) {
			return implicit_profile_tag{ number_size_for(number), number };
		}
		inline tag fully_qualified(std::uint16_t vendor_id, std::uint16_t profile_number, std::uint32_t number) {
			return fully_qualified_tag{ vendor_id, profile_number, number_size_for(number), number };
		}

		inline tag_control control_of(const tag& t) noexcept {
			return std::visit([](const auto& v) -> tag_control {
				using T = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<T, anonymous_tag>) {
					return tag_control::anonymous;
				}
				else if constexpr (std::is_same_v<T, context_tag>) {
					return tag_control::context_specific;
				}
				else if constexpr (std::is_same_v<T, common_profile_tag>) {
					return v.size == tag_number_size::two ? tag_control::common_profile_2
						: tag_control::common_profile_4;
				}
				else if constexpr (std::is_same_v<T, implicit_profile_tag>) {
					return v.size == tag_number_size::two ? tag_control::implicit_profile_2
						: tag_control::implicit_profile_4;
				}
				else if constexpr (std::is_same_v<T, fully_qualified_tag>) {
					return v.size == tag_number_size::two ? tag_control::fully_qualified_6
						: tag_control::fully_qualified_8;
				}
				else {
					static_assert(always_false_v<T>, "unhandled tag alternative");
				}
			}, t);
		}

		constexpr inline std::size_t octet_count(tag_control ctrl) noexcept {
			switch (ctrl) {
			case tag_control::anonymous:          return 0;
			case tag_control::context_specific:   return 1;
			case tag_control::common_profile_2:   return 2;
			case tag_control::common_profile_4:   return 4;
			case tag_control::implicit_profile_2: return 2;
			case tag_control::implicit_profile_4: return 4;
			case tag_control::fully_qualified_6:  return 6;
			case tag_control::fully_qualified_8:  return 8;
			}
			return 0;
		}

		inline std::size_t octet_count(const tag& t) noexcept {
			return octet_count(control_of(t));
		}

		namespace detail {
			inline std::size_t store_number(tag_number_size size, std::uint32_t number, byte* where) {
				if (size == tag_number_size::two) {
					if (number > std::numeric_limits<std::uint16_t>::max()) {
						throw tlv_error(errc::invalid_tag,
							std::format("tag number {} does not fit in two octets", number));
					}
					byteorder::native_to_le<std::uint16_t>(static_cast<std::uint16_t>(number), where);
					return 2;
				}
				byteorder::native_to_le<std::uint32_t>(number, where);
				return 4;
			}

			inline std::uint32_t load_number(tag_number_size size, const byte* where) {
				if (size == tag_number_size::two) {
					return byteorder::le_to_native<std::uint16_t>(where);
				}
				return byteorder::le_to_native<std::uint32_t>(where);
			}
		}

		// Writes the tag octets to `where` (room for MAX_TAG_OCTETS) and returns
		// the control bits with the number of octets written. Two-octet forms
		// keep the low 16 bits of the tag number.
		inline std::tuple<std::uint8_t, std::size_t> encode(const tag& t, byte* where) {
			const auto ctrl = control_of(t);
			const std::size_t written = std::visit([where](const auto& v) -> std::size_t {
				using T = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<T, anonymous_tag>) {
					return 0;
				}
				else if constexpr (std::is_same_v<T, context_tag>) {
					where[0] = static_cast<byte>(v.number);
					return 1;
				}
				else if constexpr (std::is_same_v<T, common_profile_tag> || std::is_same_v<T, implicit_profile_tag>) {
					return detail::store_number(v.size, v.number, where);
				}
				else if constexpr (std::is_same_v<T, fully_qualified_tag>) {
					byteorder::native_to_le<std::uint16_t>(v.vendor_id, where);
					byteorder::native_to_le<std::uint16_t>(v.profile_number, where + 2);
					return 4 + detail::store_number(v.size, v.number, where + 4);
				}
				else {
					static_assert(always_false_v<T>, "unhandled tag alternative");
				}
			}, t);
			return { static_cast<std::uint8_t>(ctrl), written };
		}

		// `control_bits` is the control byte with the type code masked off.
		inline std::tuple<tag, byte_view> decode(std::uint8_t control_bits, byte_view bytes) {
			if ((control_bits & ~TAG_CONTROL_MASK) != 0) {
				throw tlv_error(errc::invalid_tag, std::format("bad tag control bits 0x{:02X}", control_bits));
			}
			const auto ctrl = static_cast<tag_control>(control_bits);
			const auto need = octet_count(ctrl);
			if (bytes.size() < need) {
				throw_under_run("tag", need, bytes.size());
			}
			const byte* p = bytes.data();
			const auto rest = bytes.subspan(need);

			switch (ctrl) {
			case tag_control::anonymous:
				return { anonymous_tag{}, rest };
			case tag_control::context_specific:
				return { context_tag{ static_cast<std::uint8_t>(p[0]) }, rest };
			case tag_control::common_profile_2:
				return { common_profile_tag{ tag_number_size::two, detail::load_number(tag_number_size::two, p) }, rest };
			case tag_control::common_profile_4:
				return { common_profile_tag{ tag_number_size::four, detail::load_number(tag_number_size::four, p) }, rest };
			case tag_control::implicit_profile_2:
				return { implicit_profile_tag{ tag_number_size::two, detail::load_number(tag_number_size::two, p) }, rest };
			case tag_control::implicit_profile_4:
				return { implicit_profile_tag{ tag_number_size::four, detail::load_number(tag_number_size::four, p) }, rest };
			case tag_control::fully_qualified_6:
			case tag_control::fully_qualified_8: {
				const auto size = (ctrl == tag_control::fully_qualified_6) ? tag_number_size::two : tag_number_size::four;
				fully_qualified_tag fq;
				fq.vendor_id = byteorder::le_to_native<std::uint16_t>(p);
				fq.profile_number = byteorder::le_to_native<std::uint16_t>(p + 2);
				fq.size = size;
				fq.number = detail::load_number(size, p + 4);
				return { fq, rest };
			}
			}
			throw tlv_error(errc::invalid_tag, std::format("bad tag control bits 0x{:02X}", control_bits));
		}

		inline std::string to_string(const tag& t) {
			return std::visit([](const auto& v) -> std::string {
				using T = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<T, anonymous_tag>) {
					return "anonymous";
				}
				else if constexpr (std::is_same_v<T, context_tag>) {
					return std::format("{}", v.number);
				}
				else if constexpr (std::is_same_v<T, common_profile_tag>) {
					return std::format("common:{}", v.number);
				}
				else if constexpr (std::is_same_v<T, implicit_profile_tag>) {
					return std::format("implicit:{}", v.number);
				}
				else if constexpr (std::is_same_v<T, fully_qualified_tag>) {
					return std::format("0x{:04X}::0x{:04X}:{}", v.vendor_id, v.profile_number, v.number);
				}
				else {
					static_assert(always_false_v<T>, "unhandled tag alternative");
				}
			}, t);
		}

	} // namespace tags

} // namespace chiptlv::codec
