/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace chiptlv::core {

	using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;
	using byte_span = std::span<byte>;

	inline byte_view as_bytes(std::string_view s) noexcept {
		return byte_view(reinterpret_cast<const byte*>(s.data()), s.size());
	}

	inline std::string_view as_chars(byte_view v) noexcept {
		return std::string_view(reinterpret_cast<const char*>(v.data()), v.size());
	}

} // namespace chiptlv::core
