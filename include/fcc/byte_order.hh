/**
 * @file byte_order.hh
 * @brief Byte order selection for integer conversions of FourCC values
 */

#pragma once

#include <fcc/endian.hh>

namespace fcc {
    /**
     * @enum byte_order
     * @brief Order in which the four stored bytes map onto a 32-bit integer
     */
    enum class byte_order {
        little, ///< First stored byte is the least significant (RIFF on disk)
        big,    ///< First stored byte is the most significant (IFF-85, QuickTime atoms)
        native  ///< Whatever the host uses; same as reinterpreting the memory
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if no byte swapping is needed for @p bo
     */
    constexpr bool byte_order_native(byte_order bo) noexcept {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
            case byte_order::native:
                return true;
        }
        // make compiler happy
        return false;
    }
}
