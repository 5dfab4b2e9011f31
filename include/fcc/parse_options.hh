/**
 * @file parse_options.hh
 * @brief Options for building FourCC values from text
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace fcc {

    /**
     * @struct parse_options
     * @brief Configuration options for fourcc::parse
     *
     * The length check is not configurable: parsing always requires
     * exactly four bytes.
     */
    struct parse_options {
        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte index in the input where the warning occurred
         * @param category Warning category (e.g., "non_printable")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for accepted but suspicious input, such as
         * control or non-ASCII bytes. If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace fcc
