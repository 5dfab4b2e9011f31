/**
 * @file json.hh
 * @brief nlohmann::json support for fourcc (built with LIBFCC_WITH_JSON)
 *
 * A fourcc is stored as a JSON string in "wire text" form: printable
 * ASCII other than the backslash as itself, the backslash as "\\" and
 * every other byte as "\xHH". The form is lossless for all 2^32 values.
 */

#pragma once

#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

#include <fcc/fcc_config.h>
#include <fcc/export_fcc.h>
#include <fcc/fourcc.hh>

#if !LIBFCC_WITH_JSON
#error "libfcc was configured without JSON support (FCC_WITH_JSON)"
#endif

namespace fcc {

    FCC_EXPORT std::string to_wire_text(const fourcc& f);

    /**
     * @brief Decode wire text back into a fourcc
     * @throws invalid_length if the text does not decode to exactly 4 bytes
     * @throws fcc_error on a malformed escape or an unescaped non-printable byte
     */
    FCC_EXPORT fourcc from_wire_text(std::string_view text);

    // Found by nlohmann::adl_serializer
    FCC_EXPORT void to_json(nlohmann::json& j, const fourcc& f);
    FCC_EXPORT void from_json(const nlohmann::json& j, fourcc& f);

    /**
     * @brief JSON Schema (draft 2020-12) describing the encoded form
     *
     * The "pattern" accepts exactly the strings from_wire_text() decodes.
     */
    FCC_EXPORT nlohmann::json json_schema();

} // namespace fcc
