/**
 * xglob Pattern Implementation
 *
 * Decodes UTF-8 at the boundary and wires the compiler and the matcher
 * together.
 *
 * Copyright (c) 2026 xglob Project
 */

#include "xglob/pattern.hpp"
#include "text/utf8.hpp"

#include <utility>

namespace xglob {

CompiledPattern::CompiledPattern(std::string source, syntax::Sequence root,
                                 size_t token_count, uint32_t sequence_count)
    : source_(std::move(source))
    , root_(std::move(root))
    , token_count_(token_count)
    , sequence_count_(sequence_count) {}

bool CompiledPattern::matches(const std::string& input) const {
    return match(input, MatchOptions{}) == MatchStatus::MATCH;
}

MatchStatus CompiledPattern::match(const std::string& input, const MatchOptions& options) const {
    text::DecodeResult decoded = text::decode_utf8(input);
    if (!decoded.ok()) {
        return MatchStatus::INVALID_INPUT;
    }

    match::Matcher matcher(root_, decoded.text, options);
    return matcher.run();
}

std::string CompiledPattern::describe() const {
    return syntax::describe(root_);
}

CompileResult compile(const std::string& text, const CompileOptions& options) {
    CompileResult result;

    text::DecodeResult decoded = text::decode_utf8(text);
    if (!decoded.ok()) {
        result.error = SyntaxError(SyntaxErrorCode::INVALID_ENCODING, decoded.error_offset, text);
        return result;
    }

    syntax::Compiler compiler(decoded.text, text, options);
    syntax::Sequence root;
    if (!compiler.compile(root)) {
        result.error = compiler.error();
        return result;
    }

    result.pattern = CompiledPattern(
        text,
        std::move(root),
        compiler.token_count(),
        compiler.sequence_count()
    );
    return result;
}

bool validate_pattern(const std::string& text) {
    return compile(text).ok();
}

bool matches(const std::string& pattern, const std::string& input) {
    CompileResult result = compile(pattern);
    if (!result.ok()) {
        return false;
    }
    return result.pattern->matches(input);
}

} // namespace xglob
