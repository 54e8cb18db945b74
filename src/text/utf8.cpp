/**
 * UTF-8 boundary helpers implementation
 */

#include "text/utf8.hpp"

namespace xglob::text {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

DecodeResult decode_utf8(std::string_view input) {
    DecodeResult result;
    result.text.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);

        if (lead < 0x80) {
            result.text.push_back(static_cast<char32_t>(lead));
            i++;
            continue;
        }

        size_t length;
        char32_t cp;
        char32_t min_value;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
            min_value = 0x10000;
        } else {
            result.valid = false;
            result.error_offset = i;
            result.text.clear();
            return result;
        }

        if (i + length > input.size()) {
            result.valid = false;
            result.error_offset = i;
            result.text.clear();
            return result;
        }

        for (size_t k = 1; k < length; ++k) {
            unsigned char c = static_cast<unsigned char>(input[i + k]);
            if (!is_continuation(c)) {
                result.valid = false;
                result.error_offset = i;
                result.text.clear();
                return result;
            }
            cp = (cp << 6) | (c & 0x3F);
        }

        // Overlong, surrogate, or out of range
        if (cp < min_value || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            result.valid = false;
            result.error_offset = i;
            result.text.clear();
            return result;
        }

        result.text.push_back(cp);
        i += length;
    }

    return result;
}

void append_utf8(std::string& out, char32_t c) {
    if (c < 0x80) {
        out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

std::string encode_utf8(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t c : text) {
        append_utf8(out, c);
    }
    return out;
}

} // namespace xglob::text
