/**
 * @file display.hh
 * @brief Human readable rendering of fourcc values without heap allocation
 *
 * Each stored byte renders independently:
 *  - 0x20..0x7E are emitted as themselves
 *  - 0x00..0x1F and 0x7F are escaped: \0, \t, \n, \r or \xHH
 *  - 0x80..0xFF are emitted as the Latin-1 character of the same code
 *    point, UTF-8 encoded
 * The result is valid UTF-8 and never contains a raw control character.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <fcc/fourcc.hh>

namespace fcc {

    constexpr bool is_control_byte(std::uint8_t c) noexcept {
        return c < 0x20 || c == 0x7F;
    }

    /**
     * @class display_buffer
     * @brief Fixed capacity text holding the rendering of one fourcc
     *
     * The worst case is four "\xHH" escapes, so 16 chars are always enough
     * for one fourcc. Characters pushed once the buffer is full are dropped.
     */
    class display_buffer {
    public:
        static constexpr std::size_t capacity = 16;

        constexpr display_buffer() noexcept = default;

        constexpr void push_back(char c) noexcept {
            if (m_size < capacity) {
                m_data[m_size++] = c;
            }
        }

        [[nodiscard]] constexpr std::string_view view() const noexcept {
            return {m_data.data(), m_size};
        }

        [[nodiscard]] constexpr const char* data() const noexcept { return m_data.data(); }
        [[nodiscard]] constexpr std::size_t size() const noexcept { return m_size; }

    private:
        std::array<char, capacity> m_data{};
        std::size_t m_size = 0;
    };

    namespace detail {
        constexpr char hex_digit(unsigned v) noexcept {
            return "0123456789abcdef"[v & 0x0F];
        }
    }

    // Append the rendering of a single byte
    constexpr void append_display(display_buffer& out, std::uint8_t c) noexcept {
        if (is_control_byte(c)) {
            out.push_back('\\');
            switch (c) {
                case 0x00: out.push_back('0'); return;
                case '\t': out.push_back('t'); return;
                case '\n': out.push_back('n'); return;
                case '\r': out.push_back('r'); return;
                default:
                    out.push_back('x');
                    out.push_back(detail::hex_digit(c >> 4));
                    out.push_back(detail::hex_digit(c));
                    return;
            }
        }
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }

    constexpr display_buffer display(const fourcc& f) noexcept {
        display_buffer out;
        for (auto c : f) {
            append_display(out, c);
        }
        return out;
    }

} // namespace fcc
