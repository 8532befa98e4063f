// tests/test_element_type.cpp
#include "tests.hpp"

#include "chiptlv/codec/element_type.hpp"
#include "chiptlv/codec/value_codec.hpp"

#include <cstdint>
#include <string>

using namespace chiptlv::codec;
using chiptlv::tests::error_of;

TEST_SUITE("codec: element types") {

    TEST_CASE("wire constants are fixed") {
        CHECK(static_cast<unsigned>(element_type::int8) == 0x00);
        CHECK(static_cast<unsigned>(element_type::uint64) == 0x07);
        CHECK(static_cast<unsigned>(element_type::boolean_true) == 0x09);
        CHECK(static_cast<unsigned>(element_type::float64) == 0x0B);
        CHECK(static_cast<unsigned>(element_type::utf8_string_1) == 0x0C);
        CHECK(static_cast<unsigned>(element_type::byte_string_8) == 0x13);
        CHECK(static_cast<unsigned>(element_type::null) == 0x14);
        CHECK(static_cast<unsigned>(element_type::list) == 0x17);
        CHECK(static_cast<unsigned>(element_type::end_of_container) == 0x18);
    }

    TEST_CASE("decode maps codes to semantic types") {
        CHECK(types::decode(0x00) == semantic_type{ signed_integer{ 1 } });
        CHECK(types::decode(0x03) == semantic_type{ signed_integer{ 8 } });
        CHECK(types::decode(0x05) == semantic_type{ unsigned_integer{ 2 } });
        CHECK(types::decode(0x06) == semantic_type{ unsigned_integer{ 4 } });
        CHECK(types::decode(0x08) == semantic_type{ boolean{ false } });
        CHECK(types::decode(0x09) == semantic_type{ boolean{ true } });
        CHECK(types::decode(0x0A) == semantic_type{ floating_point{ 4 } });
        CHECK(types::decode(0x0B) == semantic_type{ floating_point{ 8 } });
        CHECK(types::decode(0x0D) == semantic_type{ utf8_string{ field_size::two } });
        CHECK(types::decode(0x12) == semantic_type{ byte_string{ field_size::four } });
        CHECK(types::decode(0x14) == semantic_type{ null_value{} });
        CHECK(types::decode(0x15) == semantic_type{ container{ container_kind::structure } });
        CHECK(types::decode(0x16) == semantic_type{ container{ container_kind::array } });
        CHECK(types::decode(0x17) == semantic_type{ container{ container_kind::list } });
        CHECK(types::decode(0x18) == semantic_type{ end_of_container{} });
    }

    TEST_CASE("encode is the inverse of decode for every assigned code") {
        for (std::uint8_t code = 0; code <= 0x18; ++code) {
            CHECK(static_cast<std::uint8_t>(types::encode(types::decode(code))) == code);
        }
    }

    TEST_CASE("unassigned codes fail with invalid_type") {
        for (std::uint8_t code = 0x19; code <= 0x1F; ++code) {
            CHECK(error_of([code] { types::decode(code); }) == errc::invalid_type);
        }
    }

    TEST_CASE("value octet count and length field size") {
        CHECK(types::value_octet_count(types::decode(0x00)) == 1);
        CHECK(types::value_octet_count(types::decode(0x07)) == 8);
        CHECK(types::value_octet_count(types::decode(0x08)) == 0);
        CHECK(types::value_octet_count(types::decode(0x0A)) == 4);
        CHECK(types::value_octet_count(types::decode(0x14)) == 0);

        CHECK(types::length_field_size(types::decode(0x0C)) == field_size::one);
        CHECK(types::length_field_size(types::decode(0x0F)) == field_size::eight);
        CHECK(types::length_field_size(types::decode(0x11)) == field_size::two);
        CHECK_FALSE(types::length_field_size(types::decode(0x04)).has_value());
        CHECK_FALSE(types::length_field_size(types::decode(0x15)).has_value());
    }

    TEST_CASE("classification") {
        for (std::uint8_t code = 0; code <= 0x18; ++code) {
            const auto st = types::decode(code);
            const int kinds = int(types::is_predetermined_length(st)) + int(types::is_specified_length(st))
                + int(types::is_container(st)) + int(types::is_end_of_container(st));
            CHECK(kinds == 1);
        }
        CHECK(types::is_container(types::decode(0x16)));
        CHECK(types::is_specified_length(types::decode(0x10)));
        CHECK(types::is_predetermined_length(types::decode(0x14)));
    }

    TEST_CASE("value_codec types line up with the wire codes") {
        CHECK(types::encode(value_codec<std::int8_t>::type()) == element_type::int8);
        CHECK(types::encode(value_codec<std::int64_t>::type()) == element_type::int64);
        CHECK(types::encode(value_codec<std::uint16_t>::type()) == element_type::uint16);
        CHECK(types::encode(value_codec<std::uint32_t>::type()) == element_type::uint32);
        CHECK(types::encode(value_codec<float>::type()) == element_type::float32);
        CHECK(types::encode(value_codec<double>::type()) == element_type::float64);
    }

    TEST_CASE("to_string") {
        CHECK(types::to_string(types::decode(0x07)) == "u64");
        CHECK(types::to_string(types::decode(0x02)) == "i32");
        CHECK(types::to_string(types::decode(0x0A)) == "f32");
        CHECK(types::to_string(types::decode(0x15)) == "structure");
        CHECK(types::to_string(types::decode(0x0C)) == "utf8");
        CHECK(std::string(to_string(errc::end_of_tlv)) == "end_of_tlv");
    }
}
