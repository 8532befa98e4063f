// tests/tests.hpp
#pragma once

#include <doctest/doctest.h>

#include <initializer_list>
#include <optional>

#include "chiptlv/core/bytes.hpp"
#include "chiptlv/codec/errors.hpp"

namespace chiptlv::tests {

    inline core::byte_buffer bytes(std::initializer_list<unsigned> list) {
        core::byte_buffer out;
        out.reserve(list.size());
        for (auto v : list) {
            out.push_back(static_cast<core::byte>(v));
        }
        return out;
    }

    // Runs fn and returns the code of the tlv_error it threw, if any.
    template <class Fn>
    std::optional<codec::errc> error_of(Fn&& fn) {
        try {
            fn();
        }
        catch (const codec::tlv_error& e) {
            return e.code();
        }
        return std::nullopt;
    }

} // namespace chiptlv::tests
