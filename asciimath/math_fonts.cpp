// math_fonts.cpp - Styled alphabet tables (bold, sans, script, fraktur, double-struck)

#include "math_fonts.hpp"
#include "../lib/log.h"
#include <utf8proc.h>

namespace asciimath {

// ============================================================================
// Substitution tables
// ============================================================================

const FontTable FONT_BOLD = {
    "bold",
    {
        // A-Z
        0x1D400, 0x1D401, 0x1D402, 0x1D403, 0x1D404, 0x1D405, 0x1D406, 0x1D407, 0x1D408, 0x1D409, 0x1D40A, 0x1D40B, 0x1D40C,
        0x1D40D, 0x1D40E, 0x1D40F, 0x1D410, 0x1D411, 0x1D412, 0x1D413, 0x1D414, 0x1D415, 0x1D416, 0x1D417, 0x1D418, 0x1D419,
        // a-z
        0x1D41A, 0x1D41B, 0x1D41C, 0x1D41D, 0x1D41E, 0x1D41F, 0x1D420, 0x1D421, 0x1D422, 0x1D423, 0x1D424, 0x1D425, 0x1D426,
        0x1D427, 0x1D428, 0x1D429, 0x1D42A, 0x1D42B, 0x1D42C, 0x1D42D, 0x1D42E, 0x1D42F, 0x1D430, 0x1D431, 0x1D432, 0x1D433,
    }
};

const FontTable FONT_SANS = {
    "sans-serif",
    {
        // A-Z
        0x1D5A0, 0x1D5A1, 0x1D5A2, 0x1D5A3, 0x1D5A4, 0x1D5A5, 0x1D5A6, 0x1D5A7, 0x1D5A8, 0x1D5A9, 0x1D5AA, 0x1D5AB, 0x1D5AC,
        0x1D5AD, 0x1D5AE, 0x1D5AF, 0x1D5B0, 0x1D5B1, 0x1D5B2, 0x1D5B3, 0x1D5B4, 0x1D5B5, 0x1D5B6, 0x1D5B7, 0x1D5B8, 0x1D5B9,
        // a-z
        0x1D5BA, 0x1D5BB, 0x1D5BC, 0x1D5BD, 0x1D5BE, 0x1D5BF, 0x1D5C0, 0x1D5C1, 0x1D5C2, 0x1D5C3, 0x1D5C4, 0x1D5C5, 0x1D5C6,
        0x1D5C7, 0x1D5C8, 0x1D5C9, 0x1D5CA, 0x1D5CB, 0x1D5CC, 0x1D5CD, 0x1D5CE, 0x1D5CF, 0x1D5D0, 0x1D5D1, 0x1D5D2, 0x1D5D3,
    }
};

const FontTable FONT_CALLIGRAPHIC = {
    "script",
    {
        // A-Z
        0x1D49C, 0x0212C, 0x1D49E, 0x1D49F, 0x02130, 0x02131, 0x1D4A2, 0x0210B, 0x02110, 0x1D4A5, 0x1D4A6, 0x02112, 0x02133,
        0x1D4A9, 0x1D4AA, 0x1D4AB, 0x1D4AC, 0x0211B, 0x1D4AE, 0x1D4AF, 0x1D4B0, 0x1D4B1, 0x1D4B2, 0x1D4B3, 0x1D4B4, 0x1D4B5,
        // a-z
        0x1D4B6, 0x1D4B7, 0x1D4B8, 0x1D4B9, 0x0212F, 0x1D4BB, 0x0210A, 0x1D4BD, 0x1D4BE, 0x1D4BF, 0x1D4C0, 0x1D4C1, 0x1D4C2,
        0x1D4C3, 0x02134, 0x1D4C5, 0x1D4C6, 0x1D4C7, 0x1D4C8, 0x1D4C9, 0x1D4CA, 0x1D4CB, 0x1D4CC, 0x1D4CD, 0x1D4CE, 0x1D4CF,
    }
};

const FontTable FONT_FRAKTUR = {
    "fraktur",
    {
        // A-Z
        0x1D504, 0x1D505, 0x0212D, 0x1D507, 0x1D508, 0x1D509, 0x1D50A, 0x0210C, 0x02111, 0x1D50D, 0x1D50E, 0x1D50F, 0x1D510,
        0x1D511, 0x1D512, 0x1D513, 0x1D514, 0x0211C, 0x1D516, 0x1D517, 0x1D518, 0x1D519, 0x1D51A, 0x1D51B, 0x1D51C, 0x02128,
        // a-z
        0x1D51E, 0x1D51F, 0x1D520, 0x1D521, 0x1D522, 0x1D523, 0x1D524, 0x1D525, 0x1D526, 0x1D527, 0x1D528, 0x1D529, 0x1D52A,
        0x1D52B, 0x1D52C, 0x1D52D, 0x1D52E, 0x1D52F, 0x1D530, 0x1D531, 0x1D532, 0x1D533, 0x1D534, 0x1D535, 0x1D536, 0x1D537,
    }
};

const FontTable FONT_DOUBLE_STRUCK = {
    "double-struck",
    {
        // A-Z
        0x1D538, 0x1D539, 0x02102, 0x1D53B, 0x1D53C, 0x1D53D, 0x1D53E, 0x0210D, 0x1D540, 0x1D541, 0x1D542, 0x1D543, 0x1D544,
        0x02115, 0x1D546, 0x02119, 0x0211A, 0x0211D, 0x1D54A, 0x1D54B, 0x1D54C, 0x1D54D, 0x1D54E, 0x1D54F, 0x1D550, 0x02124,
        // a-z
        0x1D552, 0x1D553, 0x1D554, 0x1D555, 0x1D556, 0x1D557, 0x1D558, 0x1D559, 0x1D55A, 0x1D55B, 0x1D55C, 0x1D55D, 0x1D55E,
        0x1D55F, 0x1D560, 0x1D561, 0x1D562, 0x1D563, 0x1D564, 0x1D565, 0x1D566, 0x1D567, 0x1D568, 0x1D569, 0x1D56A, 0x1D56B,
    }
};

// ============================================================================
// Lookup
// ============================================================================

uint32_t font_substitute_char(const FontTable* table, char c) {
    if (!table) return 0;
    if (c >= 'A' && c <= 'Z') return table->letters[c - 'A'];
    if (c >= 'a' && c <= 'z') return table->letters[26 + (c - 'a')];
    return 0;
}

size_t append_utf8(std::string* out, uint32_t codepoint) {
    if (!utf8proc_codepoint_valid((utf8proc_int32_t)codepoint)) {
        log_debug("math_fonts: invalid code point U+%04X", codepoint);
        return 0;
    }
    utf8proc_uint8_t buf[4];
    utf8proc_ssize_t n = utf8proc_encode_char((utf8proc_int32_t)codepoint, buf);
    if (n <= 0) return 0;
    out->append((const char*)buf, (size_t)n);
    return (size_t)n;
}

void font_substitute_text(const FontTable* table, const char* text, size_t len, std::string* out) {
    if (!table) {
        out->append(text, len);
        return;
    }
    for (size_t i = 0; i < len; i++) {
        uint32_t cp = font_substitute_char(table, text[i]);
        if (cp == 0 || append_utf8(out, cp) == 0) {
            out->push_back(text[i]);
        }
    }
}

} // namespace asciimath
