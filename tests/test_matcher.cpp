// test_matcher.cpp - Tests for the backtracking matcher
// Part of xglob - extended glob patterns for strings

#include "match/matcher.hpp"
#include "xglob/pattern.hpp"

#include "test_common.hpp"

#include <string>

using namespace xglob;

// =============================================================================
// Helpers
// =============================================================================

static CompiledPattern pattern(const std::string& text) {
    CompileResult result = xglob::compile(text);
    if (!result.ok()) {
        throw std::runtime_error("unexpected compile error: " + result.error.format());
    }
    return *result.pattern;
}

static bool m(const std::string& text, const std::string& input) {
    return pattern(text).matches(input);
}

// =============================================================================
// Wildcards
// =============================================================================

void test_star_matches_everything() {
    ASSERT(m("*", ""));
    ASSERT(m("*", "a"));
    ASSERT(m("*", "/a/b/c"));
    ASSERT(m("**", "/a/b/c/d/e/f"));
    ASSERT(m("**", ""));
    ASSERT(m("**", ".asdf"));
}

void test_question_mark() {
    ASSERT(!m("?", ""));
    ASSERT(m("?", "a"));
    ASSERT(!m("?", "ab"));
    ASSERT(m("a?c", "abc"));
    ASSERT(!m("a?c", "ac"));
}

void test_escaped_star() {
    ASSERT(m("star\\*", "star*"));
    ASSERT(!m("star\\*", "star-"));
    ASSERT(m("star\\**", "star*light"));
}

void test_star_backtracking() {
    ASSERT(m("a*b", "a_b"));
    ASSERT(m("a*b*c", "abc"));
    ASSERT(!m("a*b*c", "abcd"));
    ASSERT(m("a*b*c", "a_b_c"));
    ASSERT(m("a*b*c", "a___b___c"));
    ASSERT(m("abc*abc*abc", "abcabcabcabcabcabcabc"));
    ASSERT(!m("abc*abc*abc", "abcabcabcabcabcabcabca"));
    ASSERT(m("a*a*a*a*a*a*a*a*a", "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"));
    ASSERT(m("a*b[xyz]c*d", "abxcdbxcddd"));
}

void test_suffix_patterns() {
    CompiledPattern p = pattern("*hello.txt");
    ASSERT(p.matches("hello.txt"));
    ASSERT(p.matches("gareth_says_hello.txt"));
    ASSERT(p.matches("some/path/to/hello.txt"));
    ASSERT(p.matches("some\\path\\to\\hello.txt"));
    ASSERT(p.matches("/an/absolute/path/to/hello.txt"));
    ASSERT(!p.matches("hello.txt-and-then-some"));
    ASSERT(!p.matches("goodbye.txt"));

    CompiledPattern rs = pattern("*.rs");
    ASSERT(rs.matches("hey.rs"));
    ASSERT(!rs.matches("hey.c"));
    ASSERT(rs.matches("/src/test.rs"));
    ASSERT(!rs.matches("/src/test.c"));
}

void test_recursive_wildcard() {
    CompiledPattern p = pattern("/var/log/**");
    ASSERT(p.matches("/var/log/test"));
    ASSERT(p.matches("/var/log/a/b"));
    ASSERT(p.matches("/var/log/a.b"));
    ASSERT(!p.matches("/var/lib/a"));

    CompiledPattern needle = pattern("some/**/needle.txt");
    ASSERT(needle.matches("some/one/needle.txt"));
    ASSERT(needle.matches("some/one/two/needle.txt"));
    ASSERT(!needle.matches("some/other/notthis.txt"));
    // Separators get no special treatment: the slashes are literal
    ASSERT(!needle.matches("some/needle.txt"));

    CompiledPattern dotfiles = pattern("**/.*");
    ASSERT(dotfiles.matches("abc/.abc"));
    ASSERT(!dotfiles.matches("ab.c"));
    ASSERT(!dotfiles.matches("abc/ab.c"));
}

void test_full_match_only() {
    ASSERT(m("abc", "abc"));
    ASSERT(!m("abc", "abcd"));
    ASSERT(!m("abc", "xabc"));
    ASSERT(!m("b", "abc"));
    ASSERT(m("", ""));
    ASSERT(!m("", "a"));
}

// =============================================================================
// Character Classes
// =============================================================================

void test_ranges() {
    CompiledPattern p = pattern("a[a-z]c");
    ASSERT(p.matches("aac"));
    ASSERT(p.matches("aec"));
    ASSERT(p.matches("azc"));
    ASSERT(!p.matches("a0c"));
    ASSERT(!p.matches("aAc"));
    ASSERT(!p.matches("aZc"));
    ASSERT(!p.matches("ac"));
}

void test_digit_ranges() {
    CompiledPattern digits = pattern("a[0-9]b");
    CompiledPattern non_digits = pattern("a[!0-9]b");
    for (char c = '0'; c <= '9'; ++c) {
        std::string input = std::string("a") + c + "b";
        ASSERT(digits.matches(input));
        ASSERT(!non_digits.matches(input));
    }
    ASSERT(!digits.matches("a_b"));
    ASSERT(non_digits.matches("a_b"));
}

void test_mixed_members_and_ranges() {
    for (const char* text : {"[a-z123]", "[1a-z23]", "[123a-z]"}) {
        CompiledPattern p = pattern(text);
        for (char c = 'a'; c <= 'z'; ++c) {
            ASSERT(p.matches(std::string(1, c)));
        }
        ASSERT(p.matches("1"));
        ASSERT(p.matches("2"));
        ASSERT(p.matches("3"));
        ASSERT(!p.matches("4"));
    }
}

void test_dash_members() {
    for (const char* text : {"[abc-]", "[-abc]", "[a-c-]"}) {
        CompiledPattern p = pattern(text);
        ASSERT(p.matches("a"));
        ASSERT(p.matches("b"));
        ASSERT(p.matches("c"));
        ASSERT(p.matches("-"));
        ASSERT(!p.matches("d"));
    }
    ASSERT(m("[-]", "-"));
    ASSERT(!m("[!-]", "-"));
    ASSERT(m("[!-]", "a"));
}

void test_empty_class() {
    ASSERT(!m("[]", ""));
    ASSERT(!m("[]", "a"));
    ASSERT(!m("[]", "]"));
    ASSERT(m("[!]", "a"));
    ASSERT(m("[!]", "]"));
    ASSERT(!m("[!]", ""));
    ASSERT(!m("[!]", "ab"));
}

void test_class_complement() {
    CompiledPattern lower = pattern("[a-z]");
    CompiledPattern not_lower = pattern("[!a-z]");
    for (char c = 0x20; c < 0x7F; ++c) {
        std::string input(1, c);
        bool expected = c >= 'a' && c <= 'z';
        ASSERT_EQ(lower.matches(input), expected);
        ASSERT_EQ(not_lower.matches(input), !expected);
    }
}

// =============================================================================
// Extended Groups
// =============================================================================

void test_zero_or_one() {
    CompiledPattern p = pattern("src/?([a-z]|[a-c]).rs");
    ASSERT(p.matches("src/a.rs"));
    ASSERT(p.matches("src/d.rs"));
    ASSERT(p.matches("src/.rs"));
    ASSERT(!p.matches("src/gg.rs"));
    ASSERT(!p.matches("src/0.rs"));
    ASSERT(!p.matches("src/123456789.rs"));
}

void test_zero_or_more() {
    CompiledPattern p = pattern("src/*([a-z]|[a-c]).rs");
    ASSERT(p.matches("src/a.rs"));
    ASSERT(p.matches("src/f.rs"));
    ASSERT(p.matches("src/ggggggggg.rs"));
    ASSERT(p.matches("src/.rs"));
    ASSERT(!p.matches("src/0.rs"));
    ASSERT(!p.matches("src/123456789.rs"));
    ASSERT(!p.matches("src/ab0.rs"));
}

void test_one_or_more() {
    CompiledPattern p = pattern("src/+([a-z]|[a-c]).rs");
    ASSERT(p.matches("src/a.rs"));
    ASSERT(p.matches("src/f.rs"));
    ASSERT(p.matches("src/ggggggggg.rs"));
    ASSERT(!p.matches("src/.rs"));
    ASSERT(!p.matches("src/0.rs"));
    ASSERT(!p.matches("src/123456789.rs"));

    CompiledPattern words = pattern("+(ab|def).txt");
    ASSERT(words.matches("ab.txt"));
    ASSERT(words.matches("abdefab.txt"));
    ASSERT(!words.matches("abde.txt"));
    ASSERT(!words.matches(".txt"));
}

void test_exactly_one() {
    CompiledPattern p = pattern("src/@([a-z]|[a-c]).rs");
    ASSERT(p.matches("src/a.rs"));
    ASSERT(p.matches("src/d.rs"));
    ASSERT(!p.matches("src/gg.rs"));
    ASSERT(!p.matches("src/0.rs"));
    ASSERT(!p.matches("src/.rs"));

    CompiledPattern ext = pattern("*.@(cpp|hpp|h)");
    ASSERT(ext.matches("main.cpp"));
    ASSERT(ext.matches("main.h"));
    ASSERT(!ext.matches("main.c"));
    ASSERT(!ext.matches("main.cpphpp"));
}

void test_none_of() {
    CompiledPattern p = pattern("src/!([a-z]|[a-c]).rs");
    ASSERT(!p.matches("src/a.rs"));
    ASSERT(!p.matches("src/d.rs"));
    ASSERT(p.matches("src/ggggggggg.rs"));
    ASSERT(!p.matches("src/ggggggggg"));
    ASSERT(p.matches("src/0.rs"));
    ASSERT(p.matches("src/123456789.rs"));
    // The empty span is matched by no alternative
    ASSERT(p.matches("src/.rs"));
}

void test_none_of_single_class() {
    CompiledPattern p = pattern("!([a-z]).rs");
    ASSERT(!p.matches("a.rs"));
    ASSERT(!p.matches("d.rs"));
    ASSERT(!p.matches("z.rs"));
    ASSERT(p.matches("A.rs"));
    ASSERT(p.matches("Z.rs"));
    ASSERT(p.matches("0.rs"));
}

void test_nested_negation() {
    CompiledPattern images = pattern("!(+(ab|def)*+(.jpg|.gif))");
    ASSERT(!images.matches("ab.jpg"));
    ASSERT(!images.matches("abc.jpg"));
    ASSERT(!images.matches("def.jpg"));
    ASSERT(!images.matches("defgh.jpg"));
    ASSERT(!images.matches("ab.gif"));
    ASSERT(!images.matches("defgh.gif"));
    ASSERT(images.matches("ced.gif"));
    ASSERT(images.matches("ced.jpg"));
    ASSERT(images.matches("test.rs"));
    ASSERT(images.matches("ab.rs"));

    // Two negations cancel out
    CompiledPattern four = pattern("!(!(!(!(vec|test)))).rs");
    ASSERT(four.matches("vec.rs"));
    ASSERT(four.matches("test.rs"));
    ASSERT(!four.matches("dot.rs"));
    ASSERT(!four.matches(".rs"));
    ASSERT(!four.matches("asfsdf.rs"));

    CompiledPattern three = pattern("!(!(!(vec|test))).rs");
    ASSERT(!three.matches("vec.rs"));
    ASSERT(!three.matches("test.rs"));
    ASSERT(three.matches("dot.rs"));
    ASSERT(three.matches("asfsdf.rs"));
}

void test_negation_followed_by_star() {
    CompiledPattern p = pattern("/var/log/!(containers)*/**");
    ASSERT(p.matches("/var/log/cpus/"));
    ASSERT(p.matches("/var/log/cpus/core_0.log"));
    // !(containers) may take the empty span and leave the rest to '*'
    ASSERT(p.matches("/var/log/containers/"));
    ASSERT(!p.matches("/var/log"));

    CompiledPattern strict = pattern("/var/log/!(containers)/*");
    ASSERT(strict.matches("/var/log/cpus/core_0.log"));
    ASSERT(!strict.matches("/var/log/containers/0.log"));
}

void test_empty_alternatives() {
    ASSERT(m("a@()b", "ab"));
    ASSERT(!m("a@()b", "axb"));

    CompiledPattern star = pattern("*(a|)");
    ASSERT(star.matches(""));
    ASSERT(star.matches("aaa"));
    ASSERT(!star.matches("b"));

    CompiledPattern plus = pattern("+(|a)");
    ASSERT(plus.matches(""));
    ASSERT(plus.matches("aa"));
    ASSERT(!plus.matches("ab"));
}

void test_groups_nest() {
    CompiledPattern p = pattern("@(+(ab)|c)x");
    ASSERT(p.matches("ababx"));
    ASSERT(p.matches("cx"));
    ASSERT(!p.matches("abcx"));
    ASSERT(!p.matches("x"));

    CompiledPattern q = pattern("*(?(a)b)");
    ASSERT(q.matches(""));
    ASSERT(q.matches("babab"));
    ASSERT(!q.matches("aab"));
}

// =============================================================================
// Unicode
// =============================================================================

void test_unicode_scalars() {
    ASSERT(m("?", "\xC3\xA9"));
    ASSERT(m("caf?", "caf\xC3\xA9"));
    ASSERT(!m("caf", "caf\xC3\xA9"));
    // [α-ω] contains β
    ASSERT(m("[\xCE\xB1-\xCF\x89]", "\xCE\xB2"));
    ASSERT(!m("[\xCE\xB1-\xCF\x89]", "b"));
    ASSERT(m("*\xF0\x9F\x98\x80", "smile \xF0\x9F\x98\x80"));
}

void test_invalid_input() {
    CompiledPattern p = pattern("*");
    ASSERT(!p.matches("\xFF"));
    ASSERT_EQ(p.match("\xFF", MatchOptions{}), MatchStatus::INVALID_INPUT);
    ASSERT_EQ(p.match("ok", MatchOptions{}), MatchStatus::MATCH);
}

// =============================================================================
// Step Budget
// =============================================================================

void test_many_consecutive_stars() {
    std::string text = std::string(64, '*') + "b";
    std::string input(500, 'a');

    MatchOptions options;
    options.max_steps = 1000;
    ASSERT_EQ(pattern(text).match(input, options), MatchStatus::NO_MATCH);
}

void test_polynomial_state_bound() {
    // "*a*a...*ab" against "aaa...": every (token, position) state is
    // expanded at most once
    const size_t n = 12;
    const size_t len = 60;

    std::string text;
    for (size_t i = 0; i < n; ++i) {
        text += "*a";
    }
    text += "b";
    std::string input(len, 'a');

    CompiledPattern p = pattern(text);
    std::u32string decoded(input.begin(), input.end());
    match::Matcher matcher(p.root(), decoded);
    ASSERT_EQ(matcher.run(), MatchStatus::NO_MATCH);
    ASSERT(matcher.steps() <= n * (len + 1));
}

void test_fixed_width_repetition_is_linear() {
    // Each repetition spans exactly two characters, so only every other
    // split point is ever tried
    const size_t len = 2000;
    std::string input;
    for (size_t i = 0; i < len / 2; ++i) {
        input += (i % 2 == 0) ? "ac" : "bc";
    }

    CompiledPattern p = pattern("*(@(a|b)c)");
    std::u32string decoded(input.begin(), input.end());
    match::Matcher matcher(p.root(), decoded);
    ASSERT_EQ(matcher.run(), MatchStatus::MATCH);
    ASSERT(matcher.steps() <= len);

    ASSERT(!p.matches(input + "a"));
    ASSERT(m("+(ab|cde)", "abcdeab"));
    ASSERT(!m("+(ab|cde)", "abcdab"));
    ASSERT(m("+(@()|xy)z", "z"));

    std::string pairs;
    for (int i = 0; i < 8000; ++i) {
        pairs += "ab";
    }
    ASSERT(m("*(ab)", pairs));
    ASSERT(!m("*(ab)", pairs + "a"));
}

void test_long_flat_pattern() {
    // As many groups as the default compile limit allows
    std::string text;
    std::string input;
    for (int i = 0; i < 4096; ++i) {
        text += "?(a)b";
        input += (i % 3 == 0) ? "b" : "ab";
    }

    CompiledPattern p = pattern(text);
    ASSERT(p.matches(input));
    ASSERT(!p.matches(input + "b"));
}

void test_step_limit_exceeded() {
    CompiledPattern p = pattern("*a*a*a*a*b");
    MatchOptions options;
    options.max_steps = 3;
    ASSERT_EQ(p.match("aaaaaaaaaaaaaaaa", options), MatchStatus::STEP_LIMIT_EXCEEDED);

    options.max_steps = 0;
    ASSERT_EQ(p.match("aaaaaaaaaaaaaaaa", options), MatchStatus::NO_MATCH);
}

void test_nested_negation_budget() {
    CompiledPattern p = pattern("!(!(*a*a*a*a))*b");
    MatchOptions options;
    options.max_steps = 5;
    ASSERT_EQ(p.match(std::string(40, 'a'), options), MatchStatus::STEP_LIMIT_EXCEEDED);
    ASSERT(!p.matches(std::string(40, 'a')));
    ASSERT(p.matches("aaaab"));
}

void test_status_strings() {
    ASSERT_EQ(std::string(match::status_string(MatchStatus::MATCH)), "match");
    ASSERT_EQ(std::string(match::status_string(MatchStatus::STEP_LIMIT_EXCEEDED)),
              "step_limit_exceeded");
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Matcher Test Suite ===\n\n";

    std::cout << "Wildcard Tests:\n";
    TEST(star_matches_everything);
    TEST(question_mark);
    TEST(escaped_star);
    TEST(star_backtracking);
    TEST(suffix_patterns);
    TEST(recursive_wildcard);
    TEST(full_match_only);

    std::cout << "\nCharacter Class Tests:\n";
    TEST(ranges);
    TEST(digit_ranges);
    TEST(mixed_members_and_ranges);
    TEST(dash_members);
    TEST(empty_class);
    TEST(class_complement);

    std::cout << "\nExtended Group Tests:\n";
    TEST(zero_or_one);
    TEST(zero_or_more);
    TEST(one_or_more);
    TEST(exactly_one);
    TEST(none_of);
    TEST(none_of_single_class);
    TEST(nested_negation);
    TEST(negation_followed_by_star);
    TEST(empty_alternatives);
    TEST(groups_nest);

    std::cout << "\nUnicode Tests:\n";
    TEST(unicode_scalars);
    TEST(invalid_input);

    std::cout << "\nStep Budget Tests:\n";
    TEST(many_consecutive_stars);
    TEST(polynomial_state_bound);
    TEST(fixed_width_repetition_is_linear);
    TEST(long_flat_pattern);
    TEST(step_limit_exceeded);
    TEST(nested_negation_budget);
    TEST(status_strings);

    return report_results();
}
