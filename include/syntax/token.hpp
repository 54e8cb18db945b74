/**
 * xglob Token Tree
 *
 * A compiled pattern is a tree of tokens. Every Sequence owns its tokens
 * by value and every Group owns its alternative Sequences, so a pattern
 * has no sharing and no cycles.
 *
 * Token kinds:
 * - Literal                 exactly one given character
 * - AnyChar                 ?
 * - AnySequence             *
 * - RecursiveAnySequence    **
 * - CharClass               [abc-z] / [!abc-z]
 * - Group                   ?(..) *(..) +(..) @(..) !(..)
 *
 * Copyright (c) 2026 xglob Project
 */

#ifndef XGLOB_SYNTAX_TOKEN_HPP
#define XGLOB_SYNTAX_TOKEN_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace xglob::syntax {

struct Sequence;

struct Literal {
    char32_t value;

    explicit Literal(char32_t v) : value(v) {}
};

struct AnyChar {};

struct AnySequence {};

// Kept distinct from AnySequence; both match the same strings.
struct RecursiveAnySequence {};

/**
 * Inclusive character range, low <= high
 */
struct CharRange {
    char32_t low;
    char32_t high;

    CharRange(char32_t lo, char32_t hi) : low(lo), high(hi) {}

    bool contains(char32_t c) const { return c >= low && c <= high; }
};

/**
 * Bracket expression
 *
 * An empty class matches nothing; an empty negated class matches any
 * single character.
 */
struct CharClass {
    bool negated = false;
    std::vector<char32_t> members;
    std::vector<CharRange> ranges;

    bool matches(char32_t c) const;
};

/**
 * Extended group quantifiers
 */
enum class GroupKind {
    ZERO_OR_ONE,    // ?(a|b)
    ZERO_OR_MORE,   // *(a|b)
    ONE_OR_MORE,    // +(a|b)
    EXACTLY_ONE,    // @(a|b)
    NONE_OF         // !(a|b)
};

struct Group {
    GroupKind kind;
    std::vector<Sequence> alternatives;

    explicit Group(GroupKind k) : kind(k) {}
};

using Token = std::variant<
    Literal,
    AnyChar,
    AnySequence,
    RecursiveAnySequence,
    CharClass,
    Group
>;

/**
 * Ordered run of tokens
 *
 * `id` is unique among all sequences of one compiled pattern. The root
 * sequence always has id 0.
 */
struct Sequence {
    uint32_t id = 0;
    std::vector<Token> tokens;

    bool empty() const { return tokens.empty(); }
    size_t size() const { return tokens.size(); }
};

/**
 * Get string representation of a token's kind (for debugging/errors)
 */
const char* token_kind_name(const Token& token);

/**
 * Get string representation of a group quantifier
 */
const char* group_kind_name(GroupKind kind);

/**
 * Get the syntax character that opens a group of this kind
 */
char group_kind_symbol(GroupKind kind);

/**
 * Render a sequence as a single line, e.g.
 *   LITERAL('a') ANY_SEQUENCE GROUP(@ [LITERAL('b')] | [])
 */
std::string describe(const Sequence& sequence);

} // namespace xglob::syntax

#endif // XGLOB_SYNTAX_TOKEN_HPP
