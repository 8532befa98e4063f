/*
 * File: errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chiptlv::codec {

	enum class errc {
		under_run = 1,  // buffer ended inside a field
		end_of_tlv,     // cursor is on the last element of the sequence
		invalid_tag,
		invalid_type,
		parse_error,
		internal,       // sink failure while writing
	};

	constexpr inline const char* to_string(errc e) noexcept {
		switch (e) {
		case errc::under_run:    return "under_run";
		case errc::end_of_tlv:   return "end_of_tlv";
		case errc::invalid_tag:  return "invalid_tag";
		case errc::invalid_type: return "invalid_type";
		case errc::parse_error:  return "parse_error";
		case errc::internal:     return "internal";
		}
		return "unknown";
	}

	class tlv_error : public std::runtime_error {
	public:
		tlv_error(errc code, const std::string& msg)
			: std::runtime_error(std::string(to_string(code)) + ": " + msg)
			, code_(code)
		{}

		errc code() const noexcept { return code_; }

	private:
		errc code_;
	};

	[[noreturn]] inline void throw_under_run(std::string_view what, std::size_t need, std::size_t have) {
		throw tlv_error(errc::under_run, std::format("{}: need {} bytes, have {}", what, need, have));
	}

} // namespace chiptlv::codec
