// tests/test_writer.cpp
#include "tests.hpp"

#include "chiptlv/codec/writer.hpp"
#include "chiptlv/codec/reader.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace chiptlv::core;
using namespace chiptlv::codec;
using chiptlv::tests::bytes;
using chiptlv::tests::error_of;

namespace {
    struct failing_sink {
        std::size_t budget = 0;
        byte_buffer* out = nullptr;
        bool write(const byte* src, std::size_t n) {
            if (n > budget) {
                return false;
            }
            budget -= n;
            out->insert(out->end(), src, src + n);
            return true;
        }
    };

    struct throwing_sink {
        bool write(const byte*, std::size_t) {
            throw std::runtime_error("device gone");
        }
    };
}

TEST_SUITE("codec: writer") {

    TEST_CASE("u64 40000000000, anonymous") {
        byte_buffer buf;
        writer w(buf);
        CHECK(w.write_u64(40000000000ull) == 9);
        CHECK(buf == bytes({ 0x07, 0x00, 0x90, 0x2F, 0x50, 0x09, 0x00, 0x00, 0x00 }));
    }

    TEST_CASE("u8 42 under every tag form") {
        byte_buffer buf;
        writer w(buf);

        SUBCASE("anonymous") {
            CHECK(w.write_u8(tags::anonymous(), 42) == 2);
            CHECK(buf == bytes({ 0x04, 0x2A }));
        }
        SUBCASE("context 1") {
            CHECK(w.write_u8(tags::context(1), 42) == 3);
            CHECK(buf == bytes({ 0x24, 0x01, 0x2A }));
        }
        SUBCASE("common profile 1") {
            CHECK(w.write_u8(tags::common_profile(1), 42) == 4);
            CHECK(buf == bytes({ 0x44, 0x01, 0x00, 0x2A }));
        }
        SUBCASE("common profile 100000") {
            CHECK(w.write_u8(tags::common_profile(100000), 42) == 6);
            CHECK(buf == bytes({ 0x64, 0xA0, 0x86, 0x01, 0x00, 0x2A }));
        }
        SUBCASE("implicit profile 4 octets") {
            w.write_u8(tags::implicit_profile(0x12345678), 42);
            CHECK(buf == bytes({ 0xA4, 0x78, 0x56, 0x34, 0x12, 0x2A }));
        }
        SUBCASE("fully qualified 6") {
            CHECK(w.write_u8(tags::fully_qualified(65521, 57069, 1), 42) == 8);
            CHECK(buf == bytes({ 0xC4, 0xF1, 0xFF, 0xED, 0xDE, 0x01, 0x00, 0x2A }));
        }
        SUBCASE("fully qualified 8") {
            CHECK(w.write_u8(tags::fully_qualified(65521, 57069, 2857762541u), 42) == 10);
            CHECK(buf == bytes({ 0xE4, 0xF1, 0xFF, 0xED, 0xDE, 0xED, 0xFE, 0x55, 0xAA, 0x2A }));
        }
    }

    TEST_CASE("primitive encodings") {
        byte_buffer buf;
        writer w(buf);

        SUBCASE("i32 -904534") {
            w.write_i32(-904534);
            CHECK(buf == bytes({ 0x02, 0xAA, 0x32, 0xF2, 0xFF }));
        }
        SUBCASE("i16 -241") {
            w.write_i16(-241);
            CHECK(buf == bytes({ 0x01, 0x0F, 0xFF }));
        }
        SUBCASE("bool") {
            w.write_bool(false);
            w.write_bool(tags::context(2), true);
            CHECK(buf == bytes({ 0x08, 0x29, 0x02 }));
        }
        SUBCASE("null") {
            CHECK(w.write_null() == 1);
            CHECK(w.write_null(tags::context(9)) == 2);
            CHECK(buf == bytes({ 0x14, 0x34, 0x09 }));
        }
        SUBCASE("f32 17.9") {
            w.write_f32(17.9f);
            CHECK(buf == bytes({ 0x0A, 0x33, 0x33, 0x8F, 0x41 }));
        }
        SUBCASE("f64 -inf") {
            w.write_f64(-std::numeric_limits<double>::infinity());
            CHECK(buf == bytes({ 0x0B, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0xFF }));
        }
        SUBCASE("utf8") {
            CHECK(w.write_utf8_string("Hello!") == 8);
            CHECK(buf == bytes({ 0x0C, 0x06, 0x48, 0x65, 0x6C, 0x6C, 0x6F, 0x21 }));
        }
        SUBCASE("byte string") {
            const auto payload = bytes({ 0x00, 0x01, 0x02, 0x03, 0x04 });
            w.write_byte_string(payload);
            CHECK(buf == bytes({ 0x10, 0x05, 0x00, 0x01, 0x02, 0x03, 0x04 }));
        }
        SUBCASE("empty strings") {
            w.write_utf8_string("");
            w.write_byte_string(byte_view{});
            CHECK(buf == bytes({ 0x0C, 0x00, 0x10, 0x00 }));
        }
    }

    TEST_CASE("minimal length field") {
        byte_buffer buf;
        writer w(buf);

        SUBCASE("255 bytes uses one octet") {
            const std::string s(255, 'a');
            CHECK(w.write_utf8_string(s) == 1 + 1 + 255);
            CHECK(buf[0] == byte{ 0x0C });
            CHECK(buf[1] == byte{ 0xFF });
        }
        SUBCASE("256 bytes uses two octets") {
            const byte_buffer payload(256, byte{ 0x5A });
            CHECK(w.write_byte_string(payload) == 1 + 2 + 256);
            CHECK(buf[0] == byte{ 0x11 });
            CHECK(buf[1] == byte{ 0x00 });
            CHECK(buf[2] == byte{ 0x01 });
        }
        SUBCASE("65536 bytes uses four octets") {
            const byte_buffer payload(65536, byte{ 0x00 });
            w.write_byte_string(tags::context(1), payload);
            CHECK(buf[0] == byte{ 0x32 });
            CHECK(buf.size() == 1 + 1 + 4 + 65536);
            CHECK(reader(buf).read_byte_string().size() == 65536);
        }
    }

    TEST_CASE("round trip of every primitive under every tag form") {
        const std::vector<tag> all_tags = {
            tags::anonymous(),
            tags::context(200),
            tags::common_profile(17),
            tags::common_profile(0xABCDEF),
            tags::implicit_profile(3),
            tags::implicit_profile(0x10000),
            tags::fully_qualified(0xFFF1, 0xDEED, 7),
            tags::fully_qualified(0xFFF1, 0xDEED, 0xAA55FEED),
        };
        const auto blob = bytes({ 0xDE, 0xAD, 0xBE, 0xEF });

        for (const auto& t : all_tags) {
            byte_buffer buf;
            writer w(buf);
            w.write_i8(t, std::numeric_limits<std::int8_t>::min());
            w.write_i16(t, -2);
            w.write_i32(t, std::numeric_limits<std::int32_t>::max());
            w.write_i64(t, std::numeric_limits<std::int64_t>::min());
            w.write_u8(t, 0xFE);
            w.write_u16(t, 0xBEEF);
            w.write_u32(t, 0xDEADBEEF);
            w.write_u64(t, std::numeric_limits<std::uint64_t>::max());
            w.write_f32(t, 1.5f);
            w.write_f64(t, -2.25);
            w.write_bool(t, true);
            w.write_bool(t, false);
            w.write_null(t);
            w.write_utf8_string(t, "\xC3\xBC" "ber");
            w.write_byte_string(t, blob);

            reader r(buf);
            auto step = [&] {
                CHECK(r.read_tag() == t);
                return r.try_next();
            };

            CHECK(r.read_i8() == std::numeric_limits<std::int8_t>::min());
            REQUIRE(step());
            CHECK(r.read_i16() == -2);
            REQUIRE(step());
            CHECK(r.read_i32() == std::numeric_limits<std::int32_t>::max());
            REQUIRE(step());
            CHECK(r.read_i64() == std::numeric_limits<std::int64_t>::min());
            REQUIRE(step());
            CHECK(r.read_u8() == 0xFE);
            REQUIRE(step());
            CHECK(r.read_u16() == 0xBEEF);
            REQUIRE(step());
            CHECK(r.read_u32() == 0xDEADBEEFu);
            REQUIRE(step());
            CHECK(r.read_u64() == std::numeric_limits<std::uint64_t>::max());
            REQUIRE(step());
            CHECK(r.read_f32() == 1.5f);
            REQUIRE(step());
            CHECK(r.read_f64() == -2.25);
            REQUIRE(step());
            CHECK(r.read_bool());
            REQUIRE(step());
            CHECK_FALSE(r.read_bool());
            REQUIRE(step());
            CHECK_NOTHROW(r.read_null());
            REQUIRE(step());
            CHECK(r.read_utf8_string() == "\xC3\xBC" "ber");
            REQUIRE(step());
            const auto back = r.read_byte_string();
            CHECK(byte_buffer(back.begin(), back.end()) == blob);
            CHECK_FALSE(step());
        }
    }

    TEST_CASE("generic write<T> picks the element type from the C++ type") {
        byte_buffer buf;
        writer w(buf);
        w.write(tags::context(1), std::uint16_t{ 7 });
        w.write(tags::context(2), 1.0);
        reader r(buf);
        CHECK(r.read_type() == semantic_type{ unsigned_integer{ 2 } });
        CHECK(r.read<std::uint16_t>() == 7);
        REQUIRE(r.next());
        CHECK(r.read_type() == semantic_type{ floating_point{ 8 } });
        CHECK(r.read<double>() == 1.0);
    }

    TEST_CASE("sink failure surfaces as internal and keeps whole elements") {
        SUBCASE("span_sink runs out of room") {
            std::array<byte, 4> mem{};
            basic_writer<span_sink> w(span_sink{ mem });
            CHECK(w.write_u8(1) == 2);
            CHECK(error_of([&] { w.write_u16(2); }) == errc::internal);
            CHECK(w.sink().size() == 2);
            CHECK(w.write_bool(true) == 1);
            CHECK(w.sink().size() == 3);
            CHECK(w.sink().available() == 1);
        }
        SUBCASE("sink refuses") {
            byte_buffer out;
            basic_writer<failing_sink> w(failing_sink{ 3, &out });
            w.write_u8(tags::context(1), 5);
            CHECK(error_of([&] { w.write_utf8_string("abc"); }) == errc::internal);
            CHECK(out == bytes({ 0x24, 0x01, 0x05 }));
        }
        SUBCASE("sink throws") {
            basic_writer<throwing_sink> w(throwing_sink{});
            CHECK(error_of([&] { w.write_null(); }) == errc::internal);
            CHECK(error_of([&] { w.open_container(container_kind::list); }) == errc::internal);
            CHECK(w.open_containers() == 0);
        }
    }

    TEST_CASE("close_container without open container is a logic error") {
        byte_buffer buf;
        writer w(buf);
        CHECK_THROWS_AS(w.close_container(), std::logic_error);
        CHECK(buf.empty());
    }

    TEST_CASE("inconsistent two-octet tag is rejected before anything is written") {
        byte_buffer buf;
        writer w(buf);
        const tag bad{ common_profile_tag{ tag_number_size::two, 0x12345 } };
        CHECK(error_of([&] { w.write_u8(bad, 1); }) == errc::invalid_tag);
        CHECK(error_of([&] { w.write_utf8_string(bad, "x"); }) == errc::invalid_tag);
        CHECK(error_of([&] { w.open_container(bad, container_kind::list); }) == errc::invalid_tag);
        CHECK(buf.empty());
        CHECK(w.open_containers() == 0);
    }
}
