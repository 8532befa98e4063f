/*
 * File: writer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <format>
#include <stdexcept>
#include <string_view>

#include "chiptlv/core/bytes.hpp"
#include "chiptlv/codec/errors.hpp"
#include "chiptlv/codec/tags.hpp"
#include "chiptlv/codec/element_type.hpp"
#include "chiptlv/codec/length_field.hpp"
#include "chiptlv/codec/value_codec.hpp"
#include "chiptlv/codec/reader.hpp"
#include "chiptlv/codec/sink.hpp"

namespace chiptlv::codec {

	using core::byte;
	using core::byte_buffer;
	using core::byte_view;

	// Every write hands the sink one complete element (or marker) in a single
	// call, so a failing sink never leaves half an element behind.
	template <ByteSink SinkT>
	class basic_writer {
	public:

		using sink_type = SinkT;

		explicit basic_writer(sink_type sink) : sink_(std::move(sink)) {}

		std::size_t write_i8(const tag& t, std::int8_t v) { return write(t, v); }
		std::size_t write_i16(const tag& t, std::int16_t v) { return write(t, v); }
		std::size_t write_i32(const tag& t, std::int32_t v) { return write(t, v); }
		std::size_t write_i64(const tag& t, std::int64_t v) { return write(t, v); }

		std::size_t write_u8(const tag& t, std::uint8_t v) { return write(t, v); }
		std::size_t write_u16(const tag& t, std::uint16_t v) { return write(t, v); }
		std::size_t write_u32(const tag& t, std::uint32_t v) { return write(t, v); }
		std::size_t write_u64(const tag& t, std::uint64_t v) { return write(t, v); }

		std::size_t write_f32(const tag& t, float v) { return write(t, v); }
		std::size_t write_f64(const tag& t, double v) { return write(t, v); }

		std::size_t write_i8(std::int8_t v) { return write_i8(tags::anonymous(), v); }
		std::size_t write_i16(std::int16_t v) { return write_i16(tags::anonymous(), v); }
		std::size_t write_i32(std::int32_t v) { return write_i32(tags::anonymous(), v); }
		std::size_t write_i64(std::int64_t v) { return write_i64(tags::anonymous(), v); }
		std::size_t write_u8(std::uint8_t v) { return write_u8(tags::anonymous(), v); }
		std::size_t write_u16(std::uint16_t v) { return write_u16(tags::anonymous(), v); }
		std::size_t write_u32(std::uint32_t v) { return write_u32(tags::anonymous(), v); }
		std::size_t write_u64(std::uint64_t v) { return write_u64(tags::anonymous(), v); }
		std::size_t write_f32(float v) { return write_f32(tags::anonymous(), v); }
		std::size_t write_f64(double v) { return write_f64(tags::anonymous(), v); }

		template <FixedWidthValue T>
		std::size_t write(const tag& t, T v) {
			std::array<byte, MAX_HEAD_OCTETS + sizeof(std::uint64_t)> buf{};
			auto n = store_head(t, value_codec<T>::type(), buf.data());
			n += value_codec<T>::store(v, buf.data() + n);
			return emit(buf.data(), n);
		}

		std::size_t write_bool(const tag& t, bool v) {
			return write_head_only(t, boolean{ v });
		}
		std::size_t write_bool(bool v) { return write_bool(tags::anonymous(), v); }

		std::size_t write_null(const tag& t) {
			return write_head_only(t, null_value{});
		}
		std::size_t write_null() { return write_null(tags::anonymous()); }

		// The bytes are written as given; checking they are UTF-8 is up to the caller.
		std::size_t write_utf8_string(const tag& t, std::string_view s) {
			return write_string(t, utf8_string{ length_field::pick_width(s.size()) }, core::as_bytes(s));
		}
		std::size_t write_utf8_string(std::string_view s) { return write_utf8_string(tags::anonymous(), s); }

		std::size_t write_byte_string(const tag& t, byte_view b) {
			return write_string(t, byte_string{ length_field::pick_width(b.size()) }, b);
		}
		std::size_t write_byte_string(byte_view b) { return write_byte_string(tags::anonymous(), b); }

		std::size_t open_container(const tag& t, container_kind kind) {
			const auto n = write_head_only(t, container{ kind });
			++depth_;
			return n;
		}
		std::size_t open_container(container_kind kind) { return open_container(tags::anonymous(), kind); }

		std::size_t close_container() {
			if (depth_ == 0) {
				throw std::logic_error("close_container: no open container");
			}
			const auto n = write_head_only(tags::anonymous(), end_of_container{});
			--depth_;
			return n;
		}

		// Appends the element under the reader's cursor verbatim.
		std::size_t copy_element(const reader& r) {
			if (r.is_end_of_container()) {
				throw std::logic_error("copy_element: cannot copy an end-of-container marker");
			}
			const auto raw = r.element_bytes();
			return emit(raw.data(), raw.size());
		}

		std::size_t open_containers() const noexcept { return depth_; }

		sink_type& sink() noexcept { return sink_; }
		const sink_type& sink() const noexcept { return sink_; }

	private:

		constexpr static const std::size_t MAX_HEAD_OCTETS = 1 + MAX_TAG_OCTETS;

		static std::size_t store_head(const tag& t, const semantic_type& st, byte* where) {
			const auto [ctrl, tag_octets] = tags::encode(t, where + 1);
			where[0] = static_cast<byte>(ctrl | static_cast<std::uint8_t>(types::encode(st)));
			return 1 + tag_octets;
		}

		std::size_t write_head_only(const tag& t, const semantic_type& st) {
			std::array<byte, MAX_HEAD_OCTETS> buf{};
			const auto n = store_head(t, st, buf.data());
			return emit(buf.data(), n);
		}

		std::size_t write_string(const tag& t, const semantic_type& st, byte_view payload) {
			const auto lf = types::length_field_size(st);
			const auto lf_octets = length_field::octet_count(*lf);

			byte_buffer element(MAX_HEAD_OCTETS + lf_octets + payload.size());
			auto n = store_head(t, st, element.data());
			n += length_field::write(*lf, payload.size(), element.data() + n);
			if (!payload.empty()) {
				std::memcpy(element.data() + n, payload.data(), payload.size());
			}
			n += payload.size();
			return emit(element.data(), n);
		}

		std::size_t emit(const byte* data, std::size_t n) {
			bool ok = false;
			try {
				ok = sink_.write(data, n);
			}
			catch (const std::exception& e) {
				throw tlv_error(errc::internal, std::format("sink failed: {}", e.what()));
			}
			if (!ok) {
				throw tlv_error(errc::internal, std::format("sink refused {} bytes", n));
			}
			return n;
		}

		sink_type sink_;
		std::size_t depth_ = 0;
	};

	using writer = basic_writer<buffer_sink>;

} // namespace chiptlv::codec
