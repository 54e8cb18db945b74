/**
 * xglob Syntax Errors
 *
 * Compilation reports the first error found scanning left to right.
 * There is no recovery and no partially compiled pattern.
 *
 * Copyright (c) 2026 xglob Project
 */

#ifndef XGLOB_SYNTAX_SYNTAX_ERROR_HPP
#define XGLOB_SYNTAX_SYNTAX_ERROR_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace xglob::syntax {

/**
 * Error codes from pattern compilation
 */
enum class SyntaxErrorCode {
    OK = 0,
    UNTERMINATED_CLASS = 1,
    UNTERMINATED_GROUP = 2,
    INVALID_RANGE = 3,
    EMPTY_GROUP_ALTERNATIVE = 4,
    DANGLING_ESCAPE = 5,
    INVALID_ENCODING = 6,
    NESTING_TOO_DEEP = 7,
    PATTERN_TOO_COMPLEX = 8
};

/**
 * A compile error anchored at a position in the pattern
 *
 * `position` counts code points into the pattern, except for
 * INVALID_ENCODING where it is the byte offset of the bad sequence.
 */
struct SyntaxError {
    SyntaxErrorCode code = SyntaxErrorCode::OK;
    size_t position = 0;
    std::string pattern;

    SyntaxError() = default;
    SyntaxError(SyntaxErrorCode c, size_t pos, std::string pat)
        : code(c), position(pos), pattern(std::move(pat)) {}

    bool ok() const { return code == SyntaxErrorCode::OK; }

    /**
     * One-line description of the error code
     */
    const char* message() const;

    /**
     * Multi-line report with a caret under the error position:
     *
     *   glob:5: error: unterminated character class
     *     abc[def
     *        ^
     */
    std::string format() const;
};

/**
 * Get human-readable error string.
 */
const char* error_string(SyntaxErrorCode code);

} // namespace xglob::syntax

#endif // XGLOB_SYNTAX_SYNTAX_ERROR_HPP
