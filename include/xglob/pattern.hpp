/**
 * xglob - extended glob patterns for strings
 *
 * Compiles glob text once into an immutable CompiledPattern and matches
 * it against any number of candidate strings. Nothing here touches the
 * filesystem.
 *
 * Features:
 * - Full glob pattern support: *, **, ?, [...], [!...]
 * - Extended groups: ?(..), *(..), +(..), @(..), !(..), nested freely
 * - Full-string matching over Unicode scalar values (UTF-8 in)
 * - Optional step budget for untrusted patterns
 *
 * Usage:
 *   auto result = xglob::compile("*.@(cpp|hpp)");
 *   if (result.ok() && result.pattern->matches("main.cpp")) { ... }
 *
 * Copyright (c) 2026 xglob Project
 */

#ifndef XGLOB_PATTERN_HPP
#define XGLOB_PATTERN_HPP

#include "match/matcher.hpp"
#include "syntax/compiler.hpp"
#include "syntax/syntax_error.hpp"
#include "syntax/token.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace xglob {

using syntax::CompileOptions;
using syntax::SyntaxError;
using syntax::SyntaxErrorCode;
using match::MatchOptions;
using match::MatchStatus;

struct CompileResult;

/**
 * Compiled, immutable glob pattern
 *
 * Safe to share between threads; matching never mutates the pattern.
 */
class CompiledPattern {
public:
    /**
     * Check if the whole input matches the whole pattern.
     *
     * @param input UTF-8 candidate string
     * @return true on a full match; false otherwise, including when the
     *         input is not valid UTF-8
     */
    bool matches(const std::string& input) const;

    /**
     * Match with an explicit step budget.
     *
     * @param input UTF-8 candidate string
     * @param options Match options
     * @return MATCH, NO_MATCH, STEP_LIMIT_EXCEEDED or INVALID_INPUT
     */
    MatchStatus match(const std::string& input, const MatchOptions& options) const;

    /**
     * Get the pattern text this was compiled from.
     */
    const std::string& source() const { return source_; }

    /**
     * Render the token tree (for debugging).
     */
    std::string describe() const;

    const syntax::Sequence& root() const { return root_; }

    size_t token_count() const { return token_count_; }
    uint32_t sequence_count() const { return sequence_count_; }

    // Compile options only decide whether a pattern is accepted, never the
    // tree it compiles to, so the source text identifies a pattern
    bool operator==(const CompiledPattern& other) const { return source_ == other.source_; }
    bool operator!=(const CompiledPattern& other) const { return !(*this == other); }

private:
    friend CompileResult compile(const std::string& text, const CompileOptions& options);

    CompiledPattern(std::string source, syntax::Sequence root,
                    size_t token_count, uint32_t sequence_count);

    std::string source_;
    syntax::Sequence root_;
    size_t token_count_;
    uint32_t sequence_count_;
};

/**
 * Result of a compile operation
 */
struct CompileResult {
    std::optional<CompiledPattern> pattern;
    SyntaxError error;

    bool ok() const { return error.ok(); }
};

/**
 * Compile a glob pattern.
 *
 * @param text UTF-8 pattern text
 * @param options Optional configuration
 * @return CompileResult with the pattern, or the first syntax error
 */
CompileResult compile(const std::string& text, const CompileOptions& options = CompileOptions{});

/**
 * Validate a glob pattern syntax.
 *
 * @param text Pattern to validate
 * @return true if pattern compiles with default options
 */
bool validate_pattern(const std::string& text);

/**
 * Compile and match in one call.
 *
 * @param pattern Glob pattern
 * @param input Candidate string
 * @return true if pattern is valid and input matches it
 */
bool matches(const std::string& pattern, const std::string& input);

} // namespace xglob

namespace std {

template <>
struct hash<xglob::CompiledPattern> {
    size_t operator()(const xglob::CompiledPattern& pattern) const {
        return hash<string>()(pattern.source());
    }
};

} // namespace std

#endif // XGLOB_PATTERN_HPP
