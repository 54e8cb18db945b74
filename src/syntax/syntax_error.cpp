/**
 * xglob Syntax Errors Implementation
 */

#include "syntax/syntax_error.hpp"

#include <sstream>

namespace xglob::syntax {

const char* error_string(SyntaxErrorCode code) {
    switch (code) {
        case SyntaxErrorCode::OK:                      return "no error";
        case SyntaxErrorCode::UNTERMINATED_CLASS:      return "unterminated character class";
        case SyntaxErrorCode::UNTERMINATED_GROUP:      return "unterminated pattern group";
        case SyntaxErrorCode::INVALID_RANGE:           return "character range is out of order";
        case SyntaxErrorCode::EMPTY_GROUP_ALTERNATIVE: return "empty alternative in pattern group";
        case SyntaxErrorCode::DANGLING_ESCAPE:         return "escape character at end of pattern";
        case SyntaxErrorCode::INVALID_ENCODING:        return "pattern is not valid UTF-8";
        case SyntaxErrorCode::NESTING_TOO_DEEP:        return "pattern groups nested too deeply";
        case SyntaxErrorCode::PATTERN_TOO_COMPLEX:     return "too many wildcards and groups in pattern";
    }
    return "unknown error";
}

const char* SyntaxError::message() const {
    return error_string(code);
}

std::string SyntaxError::format() const {
    std::ostringstream oss;
    oss << "glob:" << (position + 1) << ": error: " << message() << "\n";
    oss << "  " << pattern << "\n";
    oss << "  " << std::string(position, ' ') << "^";
    return oss.str();
}

} // namespace xglob::syntax
