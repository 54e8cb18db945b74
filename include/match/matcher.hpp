/**
 * xglob Matcher
 *
 * Backtracking matcher over a compiled token tree. The search state is
 * (sequence, token index, span begin, span end): "do the tokens of this
 * sequence from this index on match exactly input[begin, end)". Every
 * branching state is memoized, so each is expanded at most once and the
 * worst case stays polynomial in pattern and input size.
 *
 * A Matcher holds the per-call scratch state (memo table, step counter)
 * and is used for one input only. The token tree it reads is never
 * modified, so any number of Matchers may share one pattern across
 * threads.
 *
 * Copyright (c) 2026 xglob Project
 */

#ifndef XGLOB_MATCH_MATCHER_HPP
#define XGLOB_MATCH_MATCHER_HPP

#include "syntax/token.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xglob::match {

/**
 * Outcome of a single match
 */
enum class MatchStatus {
    MATCH = 0,
    NO_MATCH = 1,
    STEP_LIMIT_EXCEEDED = 2,
    INVALID_INPUT = 3
};

/**
 * Match options
 */
struct MatchOptions {
    // Maximum number of expanded search states; 0 means unlimited
    size_t max_steps = 0;
};

/**
 * Get human-readable status string.
 */
const char* status_string(MatchStatus status);

class Matcher {
public:
    /**
     * Construct a matcher for one input
     *
     * @param root Root sequence of a compiled pattern
     * @param input Decoded input text
     * @param options Match options
     */
    Matcher(const syntax::Sequence& root, std::u32string_view input,
            const MatchOptions& options = MatchOptions{});

    Matcher(const Matcher&) = delete;
    Matcher& operator=(const Matcher&) = delete;

    /**
     * Match the whole input against the whole pattern.
     */
    MatchStatus run();

    // Number of search states expanded so far
    size_t steps() const { return steps_; }

private:
    struct StateKey {
        uint32_t sequence;
        uint32_t token;
        uint64_t begin;
        uint64_t end;

        bool operator==(const StateKey& other) const {
            return sequence == other.sequence && token == other.token &&
                   begin == other.begin && end == other.end;
        }
    };

    struct StateKeyHash {
        size_t operator()(const StateKey& key) const;
    };

    const syntax::Sequence& root;
    std::u32string_view input;
    MatchOptions options;
    size_t steps_ = 0;
    bool exhausted = false;
    std::unordered_map<StateKey, bool, StateKeyHash> memo;

    bool match_from(const syntax::Sequence& seq, size_t token, size_t pos, size_t end);
    bool expand(const syntax::Sequence& seq, size_t token, size_t pos, size_t end);

    bool match_wildcard(const syntax::Sequence& seq, size_t token, size_t pos, size_t end);
    bool match_choice(const syntax::Sequence& seq, size_t token, const syntax::Group& group,
                      size_t pos, size_t end);
    bool match_repeat(const syntax::Sequence& seq, size_t token, const syntax::Group& group,
                      size_t pos, size_t end);
    bool match_none_of(const syntax::Sequence& seq, size_t token, const syntax::Group& group,
                       size_t pos, size_t end);

    // True if some alternative matches exactly input[begin, end)
    bool any_alternative(const syntax::Group& group, size_t begin, size_t end);

    bool tick();
};

} // namespace xglob::match

#endif // XGLOB_MATCH_MATCHER_HPP
