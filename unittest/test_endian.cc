//
// Byte order helpers
//

#include <doctest/doctest.h>
#include <fcc/endian.hh>
#include <fcc/byte_order.hh>

#include <cstring>

using namespace fcc;

TEST_SUITE("ENDIAN") {
    TEST_CASE("host byte order matches configuration") {
        const std::uint32_t probe = 0x01020304u;
        unsigned char first;
        std::memcpy(&first, &probe, 1);

        CHECK(is_little_endian != is_big_endian);
        CHECK(is_big_endian == (first == 0x01));
        CHECK(is_little_endian == (first == 0x04));
    }

    TEST_CASE("swap32") {
        static_assert(swap32(0x01020304u) == 0x04030201u);
        CHECK(swap32(0x41424344u) == 0x44434241u);
        CHECK(swap32(swap32(0xDEADBEEFu)) == 0xDEADBEEFu);
        CHECK(swap32(0u) == 0u);
        CHECK(swap32(0xFF000000u) == 0x000000FFu);
    }

    TEST_CASE("byte_order_native") {
        CHECK(byte_order_native(byte_order::native));
        CHECK(byte_order_native(byte_order::little) == is_little_endian);
        CHECK(byte_order_native(byte_order::big) == is_big_endian);
        CHECK(byte_order_native(byte_order::little) != byte_order_native(byte_order::big));
    }
}
