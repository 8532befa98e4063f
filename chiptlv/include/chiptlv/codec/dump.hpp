/*
 * File: dump.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "chiptlv/core/bytes.hpp"
#include "chiptlv/codec/reader.hpp"

namespace chiptlv::codec {

	using core::byte_view;

	namespace detail {

		inline std::string hex_preview(byte_view data, std::size_t limit = 16) {
			std::string out;
			const auto n = std::min(data.size(), limit);
			for (std::size_t i = 0; i < n; ++i) {
				if (i != 0) {
					out += ' ';
				}
				out += std::format("{:02X}", static_cast<unsigned>(data[i]));
			}
			if (data.size() > limit) {
				out += " ...";
			}
			return out;
		}

		inline void dump_value(std::ostream& os, const reader& r, const semantic_type& st) {
			std::visit([&](const auto& v) {
				using T = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<T, signed_integer>) {
					switch (v.width) {
					case 1: os << static_cast<int>(r.read_i8()); break;
					case 2: os << r.read_i16(); break;
					case 4: os << r.read_i32(); break;
					default: os << r.read_i64(); break;
					}
				}
				else if constexpr (std::is_same_v<T, unsigned_integer>) {
					switch (v.width) {
					case 1: os << static_cast<unsigned>(r.read_u8()); break;
					case 2: os << r.read_u16(); break;
					case 4: os << r.read_u32(); break;
					default: os << r.read_u64(); break;
					}
				}
				else if constexpr (std::is_same_v<T, boolean>) {
					os << (v.value ? "true" : "false");
				}
				else if constexpr (std::is_same_v<T, floating_point>) {
					if (v.width == 4) {
						os << std::format("{}", r.read_f32());
					}
					else {
						os << std::format("{}", r.read_f64());
					}
				}
				else if constexpr (std::is_same_v<T, null_value>) {
					os << "null";
				}
				else if constexpr (std::is_same_v<T, utf8_string>) {
					os << '"' << r.read_utf8_string() << '"';
				}
				else if constexpr (std::is_same_v<T, byte_string>) {
					const auto bytes = r.read_byte_string();
					os << std::format("[len:{}]", bytes.size());
					if (!bytes.empty()) {
						os << ' ' << hex_preview(bytes);
					}
				}
				else if constexpr (std::is_same_v<T, container> || std::is_same_v<T, end_of_container>) {
					// printed by dump_all
				}
				else {
					static_assert(types::always_false_v<T>, "unhandled element type");
				}
			}, st);
		}

		inline std::string label_of(const element_head& head, const std::string& pad) {
			std::string label = pad;
			if (!std::holds_alternative<anonymous_tag>(head.tag)) {
				label += tags::to_string(head.tag) + " = ";
			}
			label += types::to_string(head.type);
			return label;
		}

		// Walks nested scopes with an explicit stack, so nesting depth is
		// bounded by memory rather than by the call stack.
		inline void dump_all(std::ostream& os, byte_view data, int step) {
			struct frame {
				reader scope;
				std::size_t indent = 0;
			};
			const auto step_size = static_cast<std::size_t>(std::max(step, 0));

			if (data.empty()) {
				return;
			}

			std::vector<frame> stack;
			stack.push_back(frame{ reader(data), 0 });

			while (!stack.empty()) {
				auto& top = stack.back();
				if (top.scope.is_end_of_container()) {
					if (!top.scope.in_container()) {
						throw tlv_error(errc::parse_error,
							std::format("end-of-container marker at offset {} outside a container", top.scope.position()));
					}
					const auto indent = top.indent - step_size;
					stack.pop_back();
					os << std::string(indent, ' ') << "}\n";
					if (!stack.back().scope.try_next()) {
						stack.pop_back();
					}
					continue;
				}

				const auto head = top.scope.peek_tag_and_type();
				const auto pad = std::string(top.indent, ' ');
				if (types::is_container(head.type)) {
					auto inner = top.scope.enter_container();
					const auto indent = top.indent + step_size;
					os << label_of(head, pad) << " {\n";
					stack.push_back(frame{ std::move(inner), indent });
					continue;
				}

				// a line is printed only once its value decoded
				std::ostringstream value;
				dump_value(value, top.scope, head.type);
				os << label_of(head, pad) << ": " << value.str() << "\n";
				if (!top.scope.try_next()) {
					stack.pop_back();
				}
			}
		}
	}

	// One element per line, members indented by `step` spaces per level.
	// Throws tlv_error on malformed input; what was printed so far stays printed.
	inline std::ostream& dump(std::ostream& os, byte_view data, int step = 2) {
		detail::dump_all(os, data, step);
		return os;
	}

} // namespace chiptlv::codec
