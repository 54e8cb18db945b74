/**
 * xglob Token Tree Implementation
 */

#include "syntax/token.hpp"
#include "text/utf8.hpp"

#include <sstream>
#include <type_traits>

namespace xglob::syntax {

bool CharClass::matches(char32_t c) const {
    bool covered = false;
    for (char32_t member : members) {
        if (member == c) {
            covered = true;
            break;
        }
    }
    if (!covered) {
        for (const auto& range : ranges) {
            if (range.contains(c)) {
                covered = true;
                break;
            }
        }
    }
    return covered != negated;
}

const char* token_kind_name(const Token& token) {
    return std::visit([](const auto& t) -> const char* {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Literal>) return "LITERAL";
        else if constexpr (std::is_same_v<T, AnyChar>) return "ANY_CHAR";
        else if constexpr (std::is_same_v<T, AnySequence>) return "ANY_SEQUENCE";
        else if constexpr (std::is_same_v<T, RecursiveAnySequence>) return "RECURSIVE_ANY_SEQUENCE";
        else if constexpr (std::is_same_v<T, CharClass>) return "CLASS";
        else return "GROUP";
    }, token);
}

const char* group_kind_name(GroupKind kind) {
    switch (kind) {
        case GroupKind::ZERO_OR_ONE:  return "ZERO_OR_ONE";
        case GroupKind::ZERO_OR_MORE: return "ZERO_OR_MORE";
        case GroupKind::ONE_OR_MORE:  return "ONE_OR_MORE";
        case GroupKind::EXACTLY_ONE:  return "EXACTLY_ONE";
        case GroupKind::NONE_OF:      return "NONE_OF";
    }
    return "UNKNOWN";
}

char group_kind_symbol(GroupKind kind) {
    switch (kind) {
        case GroupKind::ZERO_OR_ONE:  return '?';
        case GroupKind::ZERO_OR_MORE: return '*';
        case GroupKind::ONE_OR_MORE:  return '+';
        case GroupKind::EXACTLY_ONE:  return '@';
        case GroupKind::NONE_OF:      return '!';
    }
    return '?';
}

namespace {

void describe_into(std::ostringstream& oss, const Sequence& sequence);

void describe_token(std::ostringstream& oss, const Token& token) {
    oss << token_kind_name(token);

    if (const auto* literal = std::get_if<Literal>(&token)) {
        std::string ch;
        text::append_utf8(ch, literal->value);
        oss << "('" << ch << "')";
    } else if (const auto* cls = std::get_if<CharClass>(&token)) {
        oss << '(';
        if (cls->negated) oss << '!';
        bool first = true;
        for (char32_t member : cls->members) {
            if (!first) oss << ' ';
            first = false;
            std::string ch;
            text::append_utf8(ch, member);
            oss << ch;
        }
        for (const auto& range : cls->ranges) {
            if (!first) oss << ' ';
            first = false;
            std::string lo;
            std::string hi;
            text::append_utf8(lo, range.low);
            text::append_utf8(hi, range.high);
            oss << lo << '-' << hi;
        }
        oss << ')';
    } else if (const auto* group = std::get_if<Group>(&token)) {
        oss << '(' << group_kind_symbol(group->kind);
        for (size_t i = 0; i < group->alternatives.size(); ++i) {
            oss << (i == 0 ? " [" : " | [");
            describe_into(oss, group->alternatives[i]);
            oss << ']';
        }
        oss << ')';
    }
}

void describe_into(std::ostringstream& oss, const Sequence& sequence) {
    for (size_t i = 0; i < sequence.tokens.size(); ++i) {
        if (i > 0) oss << ' ';
        describe_token(oss, sequence.tokens[i]);
    }
}

} // namespace

std::string describe(const Sequence& sequence) {
    std::ostringstream oss;
    describe_into(oss, sequence);
    return oss.str();
}

} // namespace xglob::syntax
