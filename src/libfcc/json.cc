//
// JSON encoding of fourcc values
//

#include <fcc/json.hh>
#include <fcc/display.hh>

namespace fcc {

    namespace {
        int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }
    }

    std::string to_wire_text(const fourcc& f) {
        std::string out;
        out.reserve(16);
        for (auto c : f) {
            if (c == '\\') {
                out += "\\\\";
            } else if (c >= 0x20 && c <= 0x7E) {
                out += static_cast<char>(c);
            } else {
                out += "\\x";
                out += detail::hex_digit(c >> 4);
                out += detail::hex_digit(c);
            }
        }
        return out;
    }

    fourcc from_wire_text(std::string_view text) {
        fourcc::storage_type bytes{};
        std::size_t count = 0;

        for (std::size_t pos = 0; pos < text.size(); ++count) {
            const auto c = static_cast<std::uint8_t>(text[pos]);
            std::uint8_t value = 0;

            if (c == '\\') {
                THROW_FCC_IF(pos + 1 >= text.size(),
                             "dangling escape at offset ", pos, " in FourCC wire text");
                const char kind = text[pos + 1];
                if (kind == '\\') {
                    value = '\\';
                    pos += 2;
                } else if (kind == 'x') {
                    THROW_FCC_IF(pos + 3 >= text.size(),
                                 "truncated \\x escape at offset ", pos, " in FourCC wire text");
                    const int hi = hex_value(text[pos + 2]);
                    const int lo = hex_value(text[pos + 3]);
                    THROW_FCC_IF(hi < 0 || lo < 0,
                                 "invalid hex digits in escape at offset ", pos, " in FourCC wire text");
                    value = static_cast<std::uint8_t>((hi << 4) | lo);
                    pos += 4;
                } else {
                    THROW_FCC("unknown escape '\\", kind, "' at offset ", pos, " in FourCC wire text");
                }
            } else {
                THROW_FCC_IF(c < 0x20 || c > 0x7E,
                             "byte 0x", detail::hex_digit(c >> 4), detail::hex_digit(c),
                             " at offset ", pos, " must be escaped in FourCC wire text");
                value = c;
                ++pos;
            }

            if (count < bytes.size()) {
                bytes[count] = value;
            }
        }

        if (count != 4) {
            THROW_INVALID_LENGTH(4, count, "FourCC wire text must decode to exactly 4 bytes, got ", count);
        }
        return bytes;
    }

    void to_json(nlohmann::json& j, const fourcc& f) {
        j = to_wire_text(f);
    }

    void from_json(const nlohmann::json& j, fourcc& f) {
        THROW_FCC_IF(!j.is_string(), "FourCC must be encoded as a JSON string, got ", j.type_name());
        f = from_wire_text(j.get_ref<const std::string&>());
    }

    nlohmann::json json_schema() {
        return {
            {"$schema", "https://json-schema.org/draft/2020-12/schema"},
            {"title", "FourCC"},
            {"description", "Four-character code. Printable ASCII except '\\' is literal, "
                            "'\\' is written as '\\\\', any other byte as '\\xHH'."},
            {"type", "string"},
            {"minLength", 4},
            {"maxLength", 16},
            {"pattern", R"(^(?:[\x20-\x5B\x5D-\x7E]|\\\\|\\x[0-9A-Fa-f]{2}){4}$)"},
            {"examples", {"RIFF", "fmt ", "A\\x0aBC"}}
        };
    }

} // namespace fcc
