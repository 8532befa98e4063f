/*
 * File: utf8.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include "chiptlv/core/bytes.hpp"

namespace chiptlv::core::utf8 {

	// Strict UTF-8 (RFC 3629): no overlongs, no surrogates, nothing above U+10FFFF.
	inline bool is_valid(byte_view data) noexcept {
		std::size_t i = 0;
		const std::size_t n = data.size();
		while (i < n) {
			const auto c0 = static_cast<std::uint8_t>(data[i]);
			if (c0 < 0x80) {
				++i;
				continue;
			}

			std::size_t tail = 0;
			std::uint8_t lo = 0x80;
			std::uint8_t hi = 0xBF;

			if (c0 >= 0xC2 && c0 <= 0xDF) {
				tail = 1;
			}
			else if (c0 == 0xE0) {
				tail = 2; lo = 0xA0;
			}
			else if (c0 == 0xED) {
				tail = 2; hi = 0x9F;
			}
			else if (c0 >= 0xE1 && c0 <= 0xEF) {
				tail = 2;
			}
			else if (c0 == 0xF0) {
				tail = 3; lo = 0x90;
			}
			else if (c0 >= 0xF1 && c0 <= 0xF3) {
				tail = 3;
			}
			else if (c0 == 0xF4) {
				tail = 3; hi = 0x8F;
			}
			else {
				return false;
			}

			if (n - i - 1 < tail) {
				return false;
			}

			const auto c1 = static_cast<std::uint8_t>(data[i + 1]);
			if (c1 < lo || c1 > hi) {
				return false;
			}
			for (std::size_t k = 2; k <= tail; ++k) {
				const auto ck = static_cast<std::uint8_t>(data[i + k]);
				if (ck < 0x80 || ck > 0xBF) {
					return false;
				}
			}
			i += tail + 1;
		}
		return true;
	}

} // namespace chiptlv::core::utf8
