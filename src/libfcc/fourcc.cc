//
// Out of line parts of fcc::fourcc: text parsing and stream output
//

#include <fcc/fourcc.hh>
#include <fcc/display.hh>
#include <ostream>
#include <iomanip>

namespace fcc {

    namespace {
        std::string describe_byte(std::uint8_t c) {
            display_buffer buf;
            append_display(buf, c);
            return build_error_msg("'", buf.view(), "' (0x",
                                   detail::hex_digit(c >> 4), detail::hex_digit(c), ")");
        }

        constexpr std::size_t max_echoed_bytes = 16;

        // Input echoed into error messages, control bytes escaped, long input cut
        std::string escape_text(std::string_view text) {
            std::string out;
            for (char ch : text.substr(0, max_echoed_bytes)) {
                display_buffer buf;
                append_display(buf, static_cast<std::uint8_t>(ch));
                out.append(buf.data(), buf.size());
            }
            if (text.size() > max_echoed_bytes) {
                out += "...";
            }
            return out;
        }
    }

    fourcc fourcc::from_prefix(const void* data, std::size_t size) {
        if (size < 4) {
            THROW_INVALID_LENGTH(4, size, "FourCC needs at least 4 bytes, buffer has ", size);
        }
        return from_bytes(data);
    }

    fourcc fourcc::parse(std::string_view text, const parse_options& opts) {
        if (text.size() != 4) {
            THROW_INVALID_LENGTH(4, text.size(), "FourCC text must be exactly 4 bytes, got ",
                                 text.size(), " in \"", escape_text(text), "\"");
        }

        fourcc result = from_bytes(text.data());

        if (opts.on_warning) {
            for (std::size_t i = 0; i < 4; ++i) {
                const auto c = result[i];
                if (c < 0x20 || c > 0x7E) {
                    opts.on_warning(i, "non_printable",
                                    build_error_msg("byte ", describe_byte(c), " at index ", i,
                                                    " is not printable ASCII"));
                }
            }
        }
        return result;
    }

    std::optional<fourcc> fourcc::try_parse(std::string_view text) noexcept {
        if (text.size() != 4) {
            return std::nullopt;
        }
        return from_bytes(text.data());
    }

    std::string fourcc::to_display_string() const {
        return std::string(display(*this).view());
    }

    std::string fourcc::to_debug_string() const {
        return build_error_msg("FourCC{", display(*this).view(), "}");
    }

    std::ostream& operator<<(std::ostream& os, const fourcc& f) {
        if (os.flags() & std::ios::hex) {
            // Save and restore format flags
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::setfill('0') << std::setw(8) << f.to_be();
            os.flags(flags);
            os.fill(fill);
        } else {
            os << display(f).view();
        }
        return os;
    }

} // namespace fcc
