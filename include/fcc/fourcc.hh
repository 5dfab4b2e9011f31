/**
 * @file fourcc.hh
 * @brief Four-character code value type
 *
 * A fourcc is exactly four bytes with no padding, so it can be embedded
 * in binary headers and reinterpreted as a byte array or a 32-bit
 * integer. Any byte pattern is a valid value.
 */

#pragma once

#include <array>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <fcc/export_fcc.h>
#include <fcc/byte_order.hh>
#include <fcc/exceptions.hh>
#include <fcc/parse_options.hh>

namespace fcc {
    class FCC_EXPORT fourcc {
    public:
        using storage_type = std::array<std::uint8_t, 4>;

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() noexcept = default;

        // Constructor from 4 individual chars
        constexpr fourcc(char c0, char c1, char c2, char c3) noexcept
            : m_bytes{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                       static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        constexpr fourcc(std::byte c0, std::byte c1, std::byte c2, std::byte c3) noexcept
            : m_bytes{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                       static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Constructor from a byte array, stored as is
        constexpr fourcc(const storage_type& bytes) noexcept
            : m_bytes(bytes) {}

        // Constructor from uint32_t (native byte order)
        explicit constexpr fourcc(std::uint32_t value) noexcept
            : m_bytes(from_uint32(value, byte_order::native).m_bytes) {}

        // Constructor from raw bytes (no padding)
        static fourcc from_bytes(const void* data) noexcept {
            fourcc result;
            std::memcpy(result.m_bytes.data(), data, 4);
            return result;
        }

        /**
         * @brief Take the first four bytes of a buffer
         * @param data Buffer start
         * @param size Buffer size in bytes
         * @throws invalid_length if @p size is less than 4
         */
        static fourcc from_prefix(const void* data, std::size_t size);

        static constexpr fourcc from_be(std::uint32_t value) noexcept {
            return storage_type{
                static_cast<std::uint8_t>(value >> 24),
                static_cast<std::uint8_t>(value >> 16),
                static_cast<std::uint8_t>(value >> 8),
                static_cast<std::uint8_t>(value)
            };
        }

        static constexpr fourcc from_le(std::uint32_t value) noexcept {
            return from_be(swap32(value));
        }

        static constexpr fourcc from_uint32(std::uint32_t value, byte_order bo) noexcept {
            switch (bo) {
                case byte_order::little:
                    return from_le(value);
                case byte_order::big:
                    return from_be(value);
                case byte_order::native:
                    break;
            }
            return byte_order_native(byte_order::big) ? from_be(value) : from_le(value);
        }

        /**
         * @brief Build a fourcc from exactly four bytes of text
         *
         * The length is counted in bytes, so "RIF\xC3\xA9" (5 bytes in UTF-8)
         * is rejected. Control and non-ASCII bytes are accepted and, if
         * opts.on_warning is set, reported with category "non_printable".
         *
         * @throws invalid_length if @p text is not exactly 4 bytes long
         */
        static fourcc parse(std::string_view text, const parse_options& opts = {});

        // Same as parse() but reports a length mismatch as std::nullopt
        static std::optional<fourcc> try_parse(std::string_view text) noexcept;

        // Convert to uint32_t (native byte order)
        [[nodiscard]] constexpr std::uint32_t to_uint32() const noexcept {
            return to_uint32(byte_order::native);
        }

        [[nodiscard]] constexpr std::uint32_t to_uint32(byte_order bo) const noexcept {
            switch (bo) {
                case byte_order::little:
                    return to_le();
                case byte_order::big:
                    return to_be();
                case byte_order::native:
                    break;
            }
            return byte_order_native(byte_order::big) ? to_be() : to_le();
        }

        // First stored byte is the most significant
        [[nodiscard]] constexpr std::uint32_t to_be() const noexcept {
            return (std::uint32_t(m_bytes[0]) << 24) | (std::uint32_t(m_bytes[1]) << 16) |
                   (std::uint32_t(m_bytes[2]) << 8) | std::uint32_t(m_bytes[3]);
        }

        [[nodiscard]] constexpr std::uint32_t to_le() const noexcept {
            return swap32(to_be());
        }

        [[nodiscard]] constexpr const storage_type& bytes() const noexcept { return m_bytes; }
        [[nodiscard]] constexpr const std::uint8_t* data() const noexcept { return m_bytes.data(); }

        // Write to bytes
        void to_bytes(void* dest) const noexcept {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        // Raw bytes as text, nothing escaped
        [[nodiscard]] std::string to_string() const {
            return std::string(m_bytes.begin(), m_bytes.end());
        }

        [[nodiscard]] std::string_view to_string_view() const noexcept {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        // Escaped, human readable form (see display.hh)
        [[nodiscard]] std::string to_display_string() const;

        // "FourCC{...}" around the display form
        [[nodiscard]] std::string to_debug_string() const;

        // Access individual bytes
        constexpr std::uint8_t operator[](std::size_t i) const noexcept { return m_bytes[i]; }

        // Iterators
        [[nodiscard]] constexpr auto begin() const noexcept { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const noexcept { return m_bytes.end(); }

        // Byte-wise comparison, bytes taken as unsigned
        [[nodiscard]] constexpr int compare(const fourcc& o) const noexcept {
            for (std::size_t i = 0; i < 4; ++i) {
                if (m_bytes[i] != o.m_bytes[i]) {
                    return m_bytes[i] < o.m_bytes[i] ? -1 : 1;
                }
            }
            return 0;
        }

        constexpr bool operator==(const fourcc& o) const noexcept { return compare(o) == 0; }
        constexpr bool operator!=(const fourcc& o) const noexcept { return compare(o) != 0; }
        constexpr bool operator<(const fourcc& o) const noexcept { return compare(o) < 0; }
        constexpr bool operator<=(const fourcc& o) const noexcept { return compare(o) <= 0; }
        constexpr bool operator>(const fourcc& o) const noexcept { return compare(o) > 0; }
        constexpr bool operator>=(const fourcc& o) const noexcept { return compare(o) >= 0; }

        // Check if contains only printable ASCII
        [[nodiscard]] constexpr bool is_printable() const noexcept {
            for (auto c : m_bytes) {
                if (c < 0x20 || c > 0x7E) {
                    return false;
                }
            }
            return true;
        }

    private:
        storage_type m_bytes{' ', ' ', ' ', ' '};
    };

    static_assert(sizeof(fourcc) == sizeof(std::uint8_t[4]), "fourcc must be exactly 4 bytes");
    static_assert(alignof(fourcc) == 1, "fourcc must not require alignment");
    static_assert(std::is_trivially_copyable_v<fourcc>, "fourcc must be memcpy-able");
    static_assert(std::is_standard_layout_v<fourcc>, "fourcc must have a C compatible layout");

    /**
     * @brief Stream output
     *
     * Writes the display form. With std::hex set, writes "0x" and the
     * eight hex digits of to_be() instead. Stream flags are preserved.
     */
    FCC_EXPORT std::ostream& operator<<(std::ostream& os, const fourcc& f);

    // Hash function
    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            const std::uint32_t v = f.to_uint32();
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time fourcc creation
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len != 4) {
            THROW_INVALID_LENGTH(4, len, "FourCC literal must be exactly 4 characters, got ", len);
        }
        return {str[0], str[1], str[2], str[3]};
    }

} // namespace fcc

// Specialization for std::hash
namespace std {
    template<>
    struct hash<fcc::fourcc> {
        std::size_t operator()(const fcc::fourcc& f) const noexcept {
            return fcc::fourcc_hash{}(f);
        }
    };
}
