/**
 * xglob Pattern Compiler
 *
 * Recursive-descent compiler from decoded pattern text to a token tree.
 *
 * Grammar:
 * - ?            any character
 * - *            any sequence
 * - **           any sequence (recursive form)
 * - [abc] [a-z]  one character from the class; [!...] negates
 * - ?(a|b)       zero or one of the alternatives
 * - *(a|b)       zero or more of the alternatives
 * - +(a|b)       one or more of the alternatives
 * - @(a|b)       exactly one of the alternatives
 * - !(a|b)       anything except the alternatives
 * - \c           the literal character c
 *
 * Copyright (c) 2026 xglob Project
 */

#ifndef XGLOB_SYNTAX_COMPILER_HPP
#define XGLOB_SYNTAX_COMPILER_HPP

#include "syntax/syntax_error.hpp"
#include "syntax/token.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xglob::syntax {

/**
 * Compile options
 */
struct CompileOptions {
    // Accept zero-token alternatives such as @() or *(a|)
    bool allow_empty_alternatives = true;
    // Maximum group nesting; 0 disables the limit
    size_t max_nesting_depth = 256;
    // Maximum number of wildcards and groups in the whole pattern; bounds
    // the matcher's recursion depth. 0 disables the limit
    size_t max_branching_tokens = 4096;
};

/**
 * Compiler class - turns one pattern into a token tree
 *
 * A Compiler is single use: construct it over a pattern, call compile()
 * once, then read the tree or the error.
 */
class Compiler {
public:
    /**
     * Construct compiler over decoded pattern text
     *
     * @param source The pattern as Unicode scalar values
     * @param pattern The original UTF-8 text (for error reporting)
     * @param options Compile options
     */
    Compiler(std::u32string_view source, std::string pattern,
             const CompileOptions& options = CompileOptions{});

    /**
     * Compile the whole pattern.
     *
     * @param out Receives the root sequence on success
     * @return true on success; on failure error() describes the problem
     */
    bool compile(Sequence& out);

    const SyntaxError& error() const { return error_; }

    // Number of sequences created (root plus every group alternative)
    uint32_t sequence_count() const { return next_sequence_id; }

    // Number of tokens created across all sequences
    size_t token_count() const { return tokens_created; }

private:
    std::u32string_view source;
    std::string pattern;
    CompileOptions options;
    uint32_t next_sequence_id = 0;
    size_t tokens_created = 0;
    size_t branching_tokens = 0;
    SyntaxError error_;

    // Recursive descent
    bool parse_sequence(size_t begin, size_t end, size_t depth, Sequence& out);
    bool parse_class(size_t& pos, size_t end, CharClass& out);
    bool parse_group(size_t& pos, size_t end, size_t depth, GroupKind kind, Group& out);

    // Extent scanning
    bool find_class_end(size_t open, size_t end, size_t& close) const;
    bool find_group_end(size_t open, size_t end, size_t& close) const;
    std::vector<size_t> split_alternatives(size_t begin, size_t end) const;

    bool emit(Sequence& out, Token token, size_t position);
    bool fail(SyntaxErrorCode code, size_t position);
};

/**
 * Map a group opener character to its quantifier.
 *
 * @return true if c is one of ? * + @ !
 */
bool group_kind_for(char32_t c, GroupKind& kind);

} // namespace xglob::syntax

#endif // XGLOB_SYNTAX_COMPILER_HPP
