/**
 * xglob Matcher Implementation
 */

#include "match/matcher.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace xglob::match {

using syntax::AnyChar;
using syntax::AnySequence;
using syntax::CharClass;
using syntax::Group;
using syntax::GroupKind;
using syntax::Literal;
using syntax::RecursiveAnySequence;
using syntax::Sequence;
using syntax::Token;

// =============================================================================
// FNV-1a Hash Constants
// =============================================================================

static constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
static constexpr uint64_t FNV_PRIME = 1099511628211ULL;

namespace {

uint64_t fnv1a_mix(uint64_t hash, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        hash ^= (value >> (i * 8)) & 0xFF;
        hash *= FNV_PRIME;
    }
    return hash;
}

bool is_wildcard(const Token& token) {
    return std::holds_alternative<AnySequence>(token) ||
           std::holds_alternative<RecursiveAnySequence>(token);
}

// True if every string the sequence matches has the same length
bool fixed_width(const Sequence& seq, size_t& width) {
    width = 0;
    for (const auto& token : seq.tokens) {
        if (is_wildcard(token)) {
            return false;
        }
        const auto* group = std::get_if<Group>(&token);
        if (group == nullptr) {
            width++;
            continue;
        }
        if (group->kind != GroupKind::EXACTLY_ONE || group->alternatives.empty()) {
            return false;
        }
        size_t first;
        if (!fixed_width(group->alternatives[0], first)) {
            return false;
        }
        for (size_t i = 1; i < group->alternatives.size(); ++i) {
            size_t other;
            if (!fixed_width(group->alternatives[i], other) || other != first) {
                return false;
            }
        }
        width += first;
    }
    return true;
}

// Collects the distinct alternative widths; false if any alternative
// can match strings of more than one length
bool alternative_widths(const Group& group, std::vector<size_t>& widths) {
    widths.clear();
    for (const auto& alternative : group.alternatives) {
        size_t width;
        if (!fixed_width(alternative, width)) {
            return false;
        }
        if (std::find(widths.begin(), widths.end(), width) == widths.end()) {
            widths.push_back(width);
        }
    }
    return true;
}

} // namespace

size_t Matcher::StateKeyHash::operator()(const StateKey& key) const {
    uint64_t hash = FNV_OFFSET_BASIS;
    hash = fnv1a_mix(hash, (static_cast<uint64_t>(key.sequence) << 32) | key.token);
    hash = fnv1a_mix(hash, key.begin);
    hash = fnv1a_mix(hash, key.end);
    return static_cast<size_t>(hash);
}

const char* status_string(MatchStatus status) {
    switch (status) {
        case MatchStatus::MATCH:               return "match";
        case MatchStatus::NO_MATCH:            return "no_match";
        case MatchStatus::STEP_LIMIT_EXCEEDED: return "step_limit_exceeded";
        case MatchStatus::INVALID_INPUT:       return "invalid_input";
    }
    return "unknown";
}

Matcher::Matcher(const Sequence& root, std::u32string_view input,
                 const MatchOptions& options)
    : root(root), input(input), options(options) {}

MatchStatus Matcher::run() {
    steps_ = 0;
    exhausted = false;
    memo.clear();

    bool matched = match_from(root, 0, 0, input.size());
    if (exhausted) {
        return MatchStatus::STEP_LIMIT_EXCEEDED;
    }
    return matched ? MatchStatus::MATCH : MatchStatus::NO_MATCH;
}

bool Matcher::tick() {
    steps_++;
    if (options.max_steps != 0 && steps_ > options.max_steps) {
        exhausted = true;
    }
    return !exhausted;
}

// =============================================================================
// Sequence walk
// =============================================================================

bool Matcher::match_from(const Sequence& seq, size_t token, size_t pos, size_t end) {
    // Single-character tokens never branch; consume them in a loop
    while (token < seq.tokens.size()) {
        const Token& t = seq.tokens[token];

        if (const auto* literal = std::get_if<Literal>(&t)) {
            if (pos >= end || input[pos] != literal->value) return false;
        } else if (std::holds_alternative<AnyChar>(t)) {
            if (pos >= end) return false;
        } else if (const auto* cls = std::get_if<CharClass>(&t)) {
            if (pos >= end || !cls->matches(input[pos])) return false;
        } else {
            break;
        }

        pos++;
        token++;
    }

    if (token == seq.tokens.size()) {
        return pos == end;
    }
    if (exhausted) {
        return false;
    }

    StateKey key{seq.id, static_cast<uint32_t>(token), pos, end};
    auto it = memo.find(key);
    if (it != memo.end()) {
        return it->second;
    }

    if (!tick()) {
        return false;
    }

    bool result = expand(seq, token, pos, end);
    if (!exhausted) {
        memo.emplace(key, result);
    }
    return result;
}

bool Matcher::expand(const Sequence& seq, size_t token, size_t pos, size_t end) {
    const Token& t = seq.tokens[token];

    if (is_wildcard(t)) {
        return match_wildcard(seq, token, pos, end);
    }

    const Group& group = std::get<Group>(t);
    switch (group.kind) {
        case GroupKind::ZERO_OR_ONE:
            if (match_from(seq, token + 1, pos, end)) return true;
            return match_choice(seq, token, group, pos, end);
        case GroupKind::EXACTLY_ONE:
            return match_choice(seq, token, group, pos, end);
        case GroupKind::ZERO_OR_MORE:
        case GroupKind::ONE_OR_MORE:
            return match_repeat(seq, token, group, pos, end);
        case GroupKind::NONE_OF:
            return match_none_of(seq, token, group, pos, end);
    }
    return false;
}

// =============================================================================
// Branching tokens
// =============================================================================

bool Matcher::match_wildcard(const Sequence& seq, size_t token, size_t pos, size_t end) {
    // Collapse a run of wildcards; they match the same strings as one
    size_t next = token + 1;
    while (next < seq.tokens.size() && is_wildcard(seq.tokens[next])) {
        next++;
    }

    if (next == seq.tokens.size()) {
        return true;
    }

    for (size_t split = pos; split <= end && !exhausted; ++split) {
        if (match_from(seq, next, split, end)) {
            return true;
        }
    }
    return false;
}

bool Matcher::match_choice(const Sequence& seq, size_t token, const Group& group,
                           size_t pos, size_t end) {
    for (const auto& alternative : group.alternatives) {
        for (size_t split = pos; split <= end && !exhausted; ++split) {
            if (match_from(alternative, 0, pos, split) &&
                match_from(seq, token + 1, split, end)) {
                return true;
            }
        }
    }
    return false;
}

bool Matcher::match_repeat(const Sequence& seq, size_t token, const Group& group,
                           size_t pos, size_t end) {
    // reached[k]: input[pos, pos + k) is covered by whole repetitions
    std::vector<char> reached(end - pos + 1, 0);
    std::vector<size_t> work;

    // With fixed-width alternatives only those widths can end a repetition
    std::vector<size_t> widths;
    bool fixed = alternative_widths(group, widths);

    auto try_span = [&](size_t from, size_t split) {
        if (reached[split - pos]) return;
        if (any_alternative(group, from, split)) {
            reached[split - pos] = 1;
            work.push_back(split);
        }
    };

    // The first repetition may be zero-width; later ones may not
    auto extend = [&](size_t from, bool allow_empty) {
        if (fixed) {
            for (size_t width : widths) {
                if (exhausted) return;
                if ((width == 0 && !allow_empty) || width > end - from) continue;
                try_span(from, from + width);
            }
            return;
        }
        for (size_t split = allow_empty ? from : from + 1; split <= end && !exhausted; ++split) {
            try_span(from, split);
        }
    };

    if (group.kind == GroupKind::ZERO_OR_MORE) {
        reached[0] = 1;
        work.push_back(pos);
    } else {
        extend(pos, true);
    }

    while (!work.empty() && !exhausted) {
        size_t from = work.back();
        work.pop_back();
        extend(from, false);
    }

    for (size_t k = 0; k < reached.size() && !exhausted; ++k) {
        if (reached[k] && match_from(seq, token + 1, pos + k, end)) {
            return true;
        }
    }
    return false;
}

bool Matcher::match_none_of(const Sequence& seq, size_t token, const Group& group,
                            size_t pos, size_t end) {
    // Shortest span first
    for (size_t split = pos; split <= end && !exhausted; ++split) {
        if (any_alternative(group, pos, split)) continue;
        if (match_from(seq, token + 1, split, end)) {
            return true;
        }
    }
    return false;
}

bool Matcher::any_alternative(const Group& group, size_t begin, size_t end) {
    for (const auto& alternative : group.alternatives) {
        if (match_from(alternative, 0, begin, end)) {
            return true;
        }
    }
    return false;
}

} // namespace xglob::match
