/*
 * File: reader.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <format>
#include <string_view>
#include <tuple>
#include <variant>

#include "chiptlv/core/bytes.hpp"
#include "chiptlv/core/debug.hpp"
#include "chiptlv/core/utf8.hpp"
#include "chiptlv/codec/errors.hpp"
#include "chiptlv/codec/tags.hpp"
#include "chiptlv/codec/element_type.hpp"
#include "chiptlv/codec/length_field.hpp"
#include "chiptlv/codec/value_codec.hpp"

namespace chiptlv::codec {

	using core::byte;
	using core::byte_view;

	struct element_head {
		codec::tag tag{};
		semantic_type type{};
		std::size_t head_octets = 0; // control byte + tag octets
	};

	// Cursor over a borrowed buffer. Nothing is cached: every accessor decodes
	// the element at the cursor again, so the buffer must stay alive and
	// unchanged while the reader is in use.
	class reader {
	public:

		reader() = default;
		explicit reader(byte_view data) : data_(data) {}
		reader(const reader&) = default;
		reader& operator = (const reader&) = default;

		element_head peek_tag_and_type() const {
			return std::get<0>(decode_head(cursor_));
		}

		codec::tag read_tag() const {
			return peek_tag_and_type().tag;
		}

		semantic_type read_type() const {
			return peek_tag_and_type().type;
		}

		std::int8_t  read_i8()  const { return read<std::int8_t>(); }
		std::int16_t read_i16() const { return read<std::int16_t>(); }
		std::int32_t read_i32() const { return read<std::int32_t>(); }
		std::int64_t read_i64() const { return read<std::int64_t>(); }

		std::uint8_t  read_u8()  const { return read<std::uint8_t>(); }
		std::uint16_t read_u16() const { return read<std::uint16_t>(); }
		std::uint32_t read_u32() const { return read<std::uint32_t>(); }
		std::uint64_t read_u64() const { return read<std::uint64_t>(); }

		float  read_f32() const { return read<float>(); }
		double read_f64() const { return read<double>(); }

		// Exact match only: a u16 element is not readable as u32 or u8.
		template <FixedWidthValue T>
		T read() const {
			auto [head, rest] = decode_head(cursor_);
			const auto expected = value_codec<T>::type();
			if (head.type != expected) {
				throw_type_mismatch(types::to_string(expected), head.type);
			}
			const auto need = value_codec<T>::size();
			if (rest.size() < need) {
				throw_under_run(std::format("{} value", types::to_string(expected)), need, rest.size());
			}
			return std::get<0>(value_codec<T>::load(rest.data()));
		}

		bool read_bool() const {
			const auto head = peek_tag_and_type();
			if (const auto* b = std::get_if<boolean>(&head.type)) {
				return b->value;
			}
			throw_type_mismatch("bool", head.type);
		}

		void read_null() const {
			const auto head = peek_tag_and_type();
			if (!std::holds_alternative<null_value>(head.type)) {
				throw_type_mismatch("null", head.type);
			}
		}

		// The returned view points into the reader's buffer.
		std::string_view read_utf8_string() const {
			auto [head, rest] = decode_head(cursor_);
			if (!std::holds_alternative<utf8_string>(head.type)) {
				throw_type_mismatch("utf8", head.type);
			}
			const auto payload = string_payload(head, rest);
			if (!core::utf8::is_valid(payload)) {
				throw tlv_error(errc::parse_error, std::format("utf8 string at offset {} is not valid UTF-8", cursor_));
			}
			return core::as_chars(payload);
		}

		byte_view read_byte_string() const {
			auto [head, rest] = decode_head(cursor_);
			if (!std::holds_alternative<byte_string>(head.type)) {
				throw_type_mismatch("bytes", head.type);
			}
			return string_payload(head, rest);
		}

		// Moves past the element at the cursor. Throws end_of_tlv, leaving the
		// cursor where it is, when that element is the last one in the buffer.
		void next() {
			if (!try_next()) {
				throw tlv_error(errc::end_of_tlv,
					std::format("no element after offset {}", cursor_));
			}
		}

		// Same as next(), but reports the end of the buffer by returning false.
		bool try_next() {
			const auto next_pos = cursor_ + element_length(cursor_);
			if (next_pos == data_.size()) {
				return false;
			}
			cursor_ = next_pos;
			return true;
		}

		// Scope of the returned reader runs from the first member up to and
		// including the matching end-of-container marker.
		reader enter_container() const {
			const auto head = peek_tag_and_type();
			if (!types::is_container(head.type)) {
				throw tlv_error(errc::invalid_type,
					std::format("element at offset {} is {}, not a container", cursor_, types::to_string(head.type)));
			}
			const auto body = cursor_ + head.head_octets;
			const auto end = container_end(body);
			reader scope(data_.subspan(body, end - body));
			scope.in_container_ = true;
			return scope;
		}

		bool is_end_of_container() const {
			if (cursor_ >= data_.size()) {
				throw_under_run("control byte", 1, 0);
			}
			const auto code = static_cast<std::uint8_t>(data_[cursor_]) & TYPE_CODE_MASK;
			return code == static_cast<std::uint8_t>(element_type::end_of_container);
		}

		// Raw encoding of the element at the cursor, containers included.
		byte_view element_bytes() const {
			return data_.subspan(cursor_, element_length(cursor_));
		}

		std::size_t position() const noexcept { return cursor_; }
		std::size_t size() const noexcept { return data_.size(); }
		bool empty() const noexcept { return data_.empty(); }
		bool in_container() const noexcept { return in_container_; }
		byte_view data() const noexcept { return data_; }

	PRIVATE_TESTABLE:

		std::tuple<element_head, byte_view> decode_head(std::size_t pos) const {
			if (pos >= data_.size()) {
				throw_under_run("control byte", 1, 0);
			}
			const auto control = static_cast<std::uint8_t>(data_[pos]);
			auto [t, rest] = tags::decode(control & TAG_CONTROL_MASK, data_.subspan(pos + 1));
			auto st = types::decode(control & TYPE_CODE_MASK);
			const auto head_octets = 1 + tags::octet_count(t);
			return { element_head{ std::move(t), std::move(st), head_octets }, rest };
		}

		// Full wire length of the element at `pos`. Throws under_run if the
		// element does not fit in the buffer.
		std::size_t element_length(std::size_t pos) const {
			auto [head, rest] = decode_head(pos);
			if (types::is_container(head.type)) {
				return container_end(pos + head.head_octets) - pos;
			}

			std::size_t body = 0;
			if (const auto lf = types::length_field_size(head.type)) {
				const auto [len, after] = length_field::read(*lf, rest);
				if (len > after.size()) {
					throw_under_run(std::format("{} payload", types::to_string(head.type)),
						static_cast<std::size_t>(std::min<std::uint64_t>(len, SIZE_MAX)), after.size());
				}
				body = length_field::octet_count(*lf) + static_cast<std::size_t>(len);
			}
			else {
				body = types::value_octet_count(head.type);
				if (body > rest.size()) {
					throw_under_run(std::format("{} value", types::to_string(head.type)), body, rest.size());
				}
			}
			return head.head_octets + body;
		}

		// `body` is the offset of the first member. Returns the offset just past
		// the end-of-container marker that closes it.
		std::size_t container_end(std::size_t body) const {
			std::size_t depth = 1;
			std::size_t pos = body;
			while (true) {
				const auto head = std::get<0>(decode_head(pos));
				if (types::is_container(head.type)) {
					++depth;
					pos += head.head_octets;
				}
				else if (types::is_end_of_container(head.type)) {
					pos += head.head_octets;
					if (--depth == 0) {
						return pos;
					}
				}
				else {
					pos += element_length(pos);
				}
			}
		}

		byte_view string_payload(const element_head& head, byte_view rest) const {
			const auto lf = types::length_field_size(head.type);
			CHIPTLV_ASSERT(lf.has_value(), "string element without length field");
			const auto [len, after] = length_field::read(*lf, rest);
			if (len > after.size()) {
				throw_under_run(std::format("{} payload", types::to_string(head.type)),
					static_cast<std::size_t>(std::min<std::uint64_t>(len, SIZE_MAX)), after.size());
			}
			return after.first(static_cast<std::size_t>(len));
		}

		[[noreturn]] void throw_type_mismatch(std::string_view expected, const semantic_type& found) const {
			throw tlv_error(errc::invalid_type,
				std::format("expected {} at offset {}, found {}", expected, cursor_, types::to_string(found)));
		}

		byte_view data_{};
		std::size_t cursor_ = 0;
		bool in_container_ = false;
	};

	// Calls fn(index, reader) for each element of the scope, stopping at the
	// end of the buffer, at the end-of-container marker of a container scope,
	// or when fn returns false. Returns the number of elements visited.
	// An end-of-container marker outside a container is a parse_error.
	template <class Fn>
	inline std::size_t for_each_element(reader r, Fn&& fn) {
		std::size_t idx = 0;
		if (r.empty()) {
			return idx;
		}
		while (true) {
			if (r.is_end_of_container()) {
				if (!r.in_container()) {
					throw tlv_error(errc::parse_error,
						std::format("end-of-container marker at offset {} outside a container", r.position()));
				}
				break;
			}
			const bool more = fn(idx, static_cast<const reader&>(r));
			++idx;
			if (!more || !r.try_next()) {
				break;
			}
		}
		return idx;
	}

} // namespace chiptlv::codec
