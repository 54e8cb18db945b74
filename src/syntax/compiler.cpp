/**
 * xglob Pattern Compiler Implementation
 */

#include "syntax/compiler.hpp"

#include <utility>
#include <variant>

namespace xglob::syntax {

bool group_kind_for(char32_t c, GroupKind& kind) {
    switch (c) {
        case U'?': kind = GroupKind::ZERO_OR_ONE;  return true;
        case U'*': kind = GroupKind::ZERO_OR_MORE; return true;
        case U'+': kind = GroupKind::ONE_OR_MORE;  return true;
        case U'@': kind = GroupKind::EXACTLY_ONE;  return true;
        case U'!': kind = GroupKind::NONE_OF;      return true;
        default:   return false;
    }
}

Compiler::Compiler(std::u32string_view source, std::string pattern,
                   const CompileOptions& options)
    : source(source), pattern(std::move(pattern)), options(options) {}

bool Compiler::compile(Sequence& out) {
    next_sequence_id = 0;
    tokens_created = 0;
    branching_tokens = 0;
    error_ = SyntaxError();
    return parse_sequence(0, source.size(), 0, out);
}

bool Compiler::fail(SyntaxErrorCode code, size_t position) {
    error_ = SyntaxError(code, position, pattern);
    return false;
}

bool Compiler::emit(Sequence& out, Token token, size_t position) {
    // Wildcards and groups each hold a matcher stack frame while the rest
    // of the pattern is tried
    if (!std::holds_alternative<Literal>(token) &&
        !std::holds_alternative<AnyChar>(token) &&
        !std::holds_alternative<CharClass>(token)) {
        branching_tokens++;
        if (options.max_branching_tokens != 0 &&
            branching_tokens > options.max_branching_tokens) {
            return fail(SyntaxErrorCode::PATTERN_TOO_COMPLEX, position);
        }
    }

    out.tokens.push_back(std::move(token));
    tokens_created++;
    return true;
}

// =============================================================================
// Extent scanning
// =============================================================================

bool Compiler::find_class_end(size_t open, size_t end, size_t& close) const {
    size_t i = open + 1;
    if (i < end && source[i] == U'!') {
        i++;
    }

    while (i < end) {
        char32_t c = source[i];
        if (c == U'\\') {
            i += 2;
            continue;
        }
        if (c == U']') {
            close = i;
            return true;
        }
        i++;
    }
    return false;
}

bool Compiler::find_group_end(size_t open, size_t end, size_t& close) const {
    size_t depth = 0;
    size_t i = open + 1;

    while (i < end) {
        char32_t c = source[i];
        if (c == U'\\') {
            i += 2;
            continue;
        }
        if (c == U'[') {
            size_t class_close;
            if (find_class_end(i, end, class_close)) {
                i = class_close + 1;
                continue;
            }
        } else if (c == U'(') {
            depth++;
        } else if (c == U')') {
            if (depth == 0) {
                close = i;
                return true;
            }
            depth--;
        }
        i++;
    }
    return false;
}

std::vector<size_t> Compiler::split_alternatives(size_t begin, size_t end) const {
    // Positions of the top-level '|' separators in [begin, end)
    std::vector<size_t> separators;
    size_t depth = 0;
    size_t i = begin;

    while (i < end) {
        char32_t c = source[i];
        if (c == U'\\') {
            i += 2;
            continue;
        }
        if (c == U'[') {
            size_t class_close;
            if (find_class_end(i, end, class_close)) {
                i = class_close + 1;
                continue;
            }
        } else if (c == U'(') {
            depth++;
        } else if (c == U')') {
            if (depth > 0) depth--;
        } else if (c == U'|' && depth == 0) {
            separators.push_back(i);
        }
        i++;
    }
    return separators;
}

// =============================================================================
// Recursive descent
// =============================================================================

bool Compiler::parse_sequence(size_t begin, size_t end, size_t depth, Sequence& out) {
    out.id = next_sequence_id++;
    out.tokens.clear();

    size_t i = begin;
    while (i < end) {
        char32_t c = source[i];

        GroupKind kind = GroupKind::EXACTLY_ONE;
        if (i + 1 < end && source[i + 1] == U'(' && group_kind_for(c, kind)) {
            size_t opener = i;
            Group group(kind);
            if (!parse_group(i, end, depth, kind, group)) {
                return false;
            }
            if (!emit(out, std::move(group), opener)) {
                return false;
            }
            continue;
        }

        size_t start = i;
        bool emitted = true;
        switch (c) {
            case U'?':
                emitted = emit(out, AnyChar{}, start);
                i++;
                break;

            case U'*':
                if (i + 1 < end && source[i + 1] == U'*') {
                    emitted = emit(out, RecursiveAnySequence{}, start);
                    i += 2;
                } else {
                    emitted = emit(out, AnySequence{}, start);
                    i++;
                }
                break;

            case U'[': {
                CharClass cls;
                if (!parse_class(i, end, cls)) {
                    return false;
                }
                emitted = emit(out, std::move(cls), start);
                break;
            }

            case U'\\':
                if (i + 1 >= end) {
                    return fail(SyntaxErrorCode::DANGLING_ESCAPE, i);
                }
                emitted = emit(out, Literal(source[i + 1]), start);
                i += 2;
                break;

            default:
                emitted = emit(out, Literal(c), start);
                i++;
                break;
        }
        if (!emitted) {
            return false;
        }
    }

    return true;
}

bool Compiler::parse_class(size_t& pos, size_t end, CharClass& out) {
    size_t open = pos;
    size_t close;
    if (!find_class_end(open, end, close)) {
        return fail(SyntaxErrorCode::UNTERMINATED_CLASS, open);
    }

    size_t i = open + 1;
    if (source[i] == U'!') {
        out.negated = true;
        i++;
    }

    // Unescape first so that range detection sees only real '-' operators
    struct Item {
        char32_t value;
        bool escaped;
        size_t position;
    };
    std::vector<Item> items;
    while (i < close) {
        if (source[i] == U'\\') {
            items.push_back({source[i + 1], true, i});
            i += 2;
        } else {
            items.push_back({source[i], false, i});
            i++;
        }
    }

    size_t k = 0;
    while (k < items.size()) {
        bool is_range = k + 2 < items.size() &&
                        items[k + 1].value == U'-' &&
                        !items[k + 1].escaped;
        if (is_range) {
            char32_t low = items[k].value;
            char32_t high = items[k + 2].value;
            if (low > high) {
                return fail(SyntaxErrorCode::INVALID_RANGE, items[k].position);
            }
            out.ranges.emplace_back(low, high);
            k += 3;
        } else {
            out.members.push_back(items[k].value);
            k++;
        }
    }

    pos = close + 1;
    return true;
}

bool Compiler::parse_group(size_t& pos, size_t end, size_t depth, GroupKind kind, Group& out) {
    size_t opener = pos;
    size_t paren = pos + 1;

    if (options.max_nesting_depth != 0 && depth + 1 > options.max_nesting_depth) {
        return fail(SyntaxErrorCode::NESTING_TOO_DEEP, opener);
    }

    size_t close;
    if (!find_group_end(paren, end, close)) {
        return fail(SyntaxErrorCode::UNTERMINATED_GROUP, opener);
    }

    out.kind = kind;

    std::vector<size_t> separators = split_alternatives(paren + 1, close);
    separators.push_back(close);

    size_t alt_begin = paren + 1;
    for (size_t alt_end : separators) {
        if (alt_begin == alt_end && !options.allow_empty_alternatives) {
            return fail(SyntaxErrorCode::EMPTY_GROUP_ALTERNATIVE, alt_begin);
        }

        Sequence alternative;
        if (!parse_sequence(alt_begin, alt_end, depth + 1, alternative)) {
            return false;
        }
        out.alternatives.push_back(std::move(alternative));
        alt_begin = alt_end + 1;
    }

    pos = close + 1;
    return true;
}

} // namespace xglob::syntax
