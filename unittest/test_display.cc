//
// Display rendering and stream output
//

#include <doctest/doctest.h>
#include <fcc/fourcc.hh>
#include <fcc/display.hh>

#include <sstream>
#include <string>

using namespace fcc;

namespace {
    fourcc make(std::uint8_t b0, std::uint8_t b1, std::uint8_t b2, std::uint8_t b3) {
        return std::array<std::uint8_t, 4>{b0, b1, b2, b3};
    }

    bool has_raw_control(std::string_view s) {
        for (char c : s) {
            auto u = static_cast<unsigned char>(c);
            if (u < 0x20 || u == 0x7F) {
                return true;
            }
        }
        return false;
    }
}

TEST_SUITE("DISPLAY") {
    TEST_CASE("printable values render as is") {
        CHECK(display(make(0x41, 0x42, 0x43, 0x44)).view() == "ABCD");
        CHECK(display("fmt "_4cc).view() == "fmt ");
        CHECK(display("a\\b~"_4cc).view() == "a\\b~");
        CHECK("RIFF"_4cc.to_display_string() == "RIFF");
    }

    TEST_CASE("control bytes are escaped") {
        SUBCASE("newline and null") {
            auto text = display(make(0x41, 0x0A, 0x42, 0x00)).view();
            CHECK(text == "A\\nB\\0");
            CHECK_FALSE(has_raw_control(text));
        }

        SUBCASE("newline in the middle") {
            CHECK(display(make(0x41, 0x0A, 0x42, 0x43)).view() == "A\\nBC");
        }

        SUBCASE("short forms") {
            CHECK(display(make('\t', '\r', '\n', 0)).view() == "\\t\\r\\n\\0");
        }

        SUBCASE("hex forms") {
            CHECK(display(make(0x01, 0x1B, 0x1F, 0x7F)).view() == "\\x01\\x1b\\x1f\\x7f");
            CHECK(display(make(0x7F, 0x7F, 0x7F, 0x7F)).size() == display_buffer::capacity);
        }

        SUBCASE("every control byte is escaped independently") {
            for (unsigned c = 0; c < 0x20; ++c) {
                auto text = make('A', static_cast<std::uint8_t>(c), 'B', 'C').to_display_string();
                CHECK_FALSE(has_raw_control(text));
                CHECK(text.front() == 'A');
                CHECK(text.substr(text.size() - 2) == "BC");
            }
        }
    }

    TEST_CASE("high bytes render as one character") {
        // U+00E9 and U+00FF in UTF-8
        CHECK(display(make('c', 'a', 'f', 0xE9)).view() == "caf\xC3\xA9");
        CHECK(display(make(0xFF, 'A', 'B', 'C')).view() == "\xC3\xBF" "ABC");
        CHECK(display(make(0x80, 0x80, 0x80, 0x80)).view() == "\xC2\x80\xC2\x80\xC2\x80\xC2\x80");
    }

    TEST_CASE("display is usable in constant expressions") {
        constexpr auto buf = display(fourcc('M', 'T', 'h', 'd'));
        static_assert(buf.size() == 4);
        CHECK(buf.view() == "MThd");
    }

    TEST_CASE("display_buffer never grows past its capacity") {
        SUBCASE("appending more than one fourcc worth of escapes") {
            display_buffer buf;
            for (int i = 0; i < 5; ++i) {
                append_display(buf, 0x7F);
            }
            CHECK(buf.size() == display_buffer::capacity);
            CHECK(buf.view() == "\\x7f\\x7f\\x7f\\x7f");
        }

        SUBCASE("reusing a full buffer") {
            auto buf = display(make(0x01, 0x02, 0x03, 0x04));
            REQUIRE(buf.size() == display_buffer::capacity);
            buf.push_back('Z');
            append_display(buf, 'Y');
            CHECK(buf.size() == display_buffer::capacity);
            CHECK(buf.view() == "\\x01\\x02\\x03\\x04");
        }

        SUBCASE("usable in constant expressions") {
            constexpr auto full = [] {
                display_buffer b;
                for (int i = 0; i < 20; ++i) {
                    b.push_back('a');
                }
                return b;
            }();
            static_assert(full.size() == display_buffer::capacity);
            CHECK(full.view() == std::string(display_buffer::capacity, 'a'));
        }
    }

    TEST_CASE("debug string") {
        CHECK("uuid"_4cc.to_debug_string() == "FourCC{uuid}");
        CHECK(make('u', 0xFF, 'i', 0).to_debug_string() == "FourCC{u\xC3\xBFi\\0}");
    }

    TEST_CASE("stream output") {
        SUBCASE("default format") {
            std::stringstream ss;
            ss << "WAVE"_4cc;
            CHECK(ss.str() == "WAVE");

            ss.str("");
            ss << make('A', '\n', 'B', 0x01);
            CHECK(ss.str() == "A\\nB\\x01");
        }

        SUBCASE("hex format") {
            std::stringstream ss;
            ss << std::hex << "WAVE"_4cc;
            CHECK(ss.str() == "0x57415645");

            ss.str("");
            ss << make(0, 0, 0, 1);
            CHECK(ss.str() == "0x00000001");

            // Round trip test
            std::uint32_t value = std::stoul(ss.str().substr(2), nullptr, 16);
            CHECK(fourcc::from_be(value) == make(0, 0, 0, 1));
        }

        SUBCASE("preserving stream state") {
            std::stringstream ss;
            ss << std::hex << std::uppercase;
            auto flags = ss.flags();
            auto fill = ss.fill();

            ss << "TEST"_4cc;

            // Flags should be preserved
            CHECK(ss.flags() == flags);
            CHECK(ss.fill() == fill);
        }
    }
}
