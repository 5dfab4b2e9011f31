/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the FourCC library
 *
 * Only text parsing and prefix extraction can fail; every other
 * conversion in the library is total.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>

namespace fcc {

    /**
     * @class fcc_error
     * @brief Base exception class for all FourCC errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch them with a single catch block.
     */
    class fcc_error : public std::runtime_error {
    public:
        explicit fcc_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class invalid_length
     * @brief Input did not provide exactly the number of bytes required
     *
     * Thrown by text parsing when the input is not 4 bytes long and by
     * prefix extraction when fewer than 4 bytes are available. The input
     * is never truncated or padded.
     */
    class invalid_length : public fcc_error {
    public:
        invalid_length(const std::string& msg, std::size_t expected, std::size_t actual)
            : fcc_error(msg), m_expected(expected), m_actual(actual) {}

        [[nodiscard]] std::size_t expected() const noexcept { return m_expected; }
        [[nodiscard]] std::size_t actual() const noexcept { return m_actual; }

    private:
        std::size_t m_expected;
        std::size_t m_actual;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_FCC
     * @brief Throw an fcc_error with formatted message
     */
    #define THROW_FCC(...) \
        throw ::fcc::fcc_error(::fcc::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_FCC_IF
     * @brief Conditionally throw an fcc_error
     */
    #define THROW_FCC_IF(condition, ...) \
        do { if (condition) THROW_FCC(__VA_ARGS__); } while(0)

    /**
     * @def THROW_INVALID_LENGTH
     * @brief Throw an invalid_length error
     * @param expected Required number of bytes
     * @param actual Number of bytes supplied
     * @param ... Variable arguments to format into error message
     */
    #define THROW_INVALID_LENGTH(expected, actual, ...) \
        throw ::fcc::invalid_length(::fcc::build_error_msg(__VA_ARGS__), (expected), (actual))

    /** @} */ // end of ExceptionMacros group

} // namespace fcc
