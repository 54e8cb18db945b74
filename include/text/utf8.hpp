/**
 * UTF-8 boundary helpers
 *
 * Patterns and inputs enter the library as UTF-8 and are matched as
 * sequences of Unicode scalar values. Decoding is strict: overlong forms,
 * surrogates, code points above U+10FFFF and truncated sequences are all
 * rejected.
 *
 * Copyright (c) 2026 xglob Project
 */

#ifndef XGLOB_TEXT_UTF8_HPP
#define XGLOB_TEXT_UTF8_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace xglob::text {

/**
 * Result of decoding a UTF-8 buffer
 */
struct DecodeResult {
    std::u32string text;
    bool valid = true;
    size_t error_offset = 0;    // byte offset of the first bad sequence

    bool ok() const { return valid; }
};

/**
 * Decode UTF-8 into scalar values.
 *
 * @param input Raw UTF-8 bytes
 * @return DecodeResult with the decoded text, or the offset of the first
 *         malformed sequence
 */
DecodeResult decode_utf8(std::string_view input);

/**
 * Append the UTF-8 encoding of a scalar value.
 */
void append_utf8(std::string& out, char32_t c);

/**
 * Encode scalar values as UTF-8.
 */
std::string encode_utf8(std::u32string_view text);

} // namespace xglob::text

#endif // XGLOB_TEXT_UTF8_HPP
