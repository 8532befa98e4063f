/*
 * File: sink.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstring>

#include "chiptlv/core/bytes.hpp"

namespace chiptlv::codec {

    using core::byte;
    using core::byte_buffer;
    using core::byte_span;
    using core::byte_view;

    // Append-only destination for encoded elements.
    // write() either takes all `n` bytes or none of them and returns false.
    template <class S>
    concept ByteSink = requires(S sink, const byte* src, std::size_t n) {
        { sink.write(src, n) } -> std::same_as<bool>;
    };

    class buffer_sink {
    public:
        buffer_sink(byte_buffer& buf) : buf_(&buf) {}

        bool write(const byte* src, std::size_t n) {
            buf_->insert(buf_->end(), src, src + n);
            return true;
        }

        const byte_buffer& buffer() const noexcept { return *buf_; }

    private:
        byte_buffer* buf_;
    };
    static_assert(ByteSink<buffer_sink>);

    // Fixed capacity sink over caller memory; refuses writes that do not fit.
    class span_sink {
    public:
        explicit span_sink(byte_span out) : out_(out) {}

        bool write(const byte* src, std::size_t n) {
            if (n > out_.size() - used_) {
                return false;
            }
            std::memcpy(out_.data() + used_, src, n);
            used_ += n;
            return true;
        }

        std::size_t size() const noexcept { return used_; }
        std::size_t available() const noexcept { return out_.size() - used_; }
        byte_view view() const noexcept { return byte_view(out_.data(), used_); }

    private:
        byte_span out_;
        std::size_t used_ = 0;
    };
    static_assert(ByteSink<span_sink>);

} // namespace chiptlv::codec
