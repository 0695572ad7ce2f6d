#include "deid_tests.h"
#include "test_helpers.h"
#include "core/deid_pattern_matcher.h"

using Deid::Configuration;
using Deid::DeidPatternMatcher;
using Deid::EntityKind;

namespace {

Configuration NumberConfig(const std::vector<std::string>& variants) {
    Configuration config;
    auto group = MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, variants);
    group.pattern = DeidPatternMatcher::DerivePattern(group);
    config.AddGroup(group);
    return config;
}

}  // namespace

void RunPatternMatcherTests(TestRunner& runner) {
    runner.Test("derive_joins_digits_loosely", "pattern", [](TestCase& t) {
        auto group = MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, {"1234567890"});
        t.CheckEq(DeidPatternMatcher::DerivePattern(group),
                  std::string(R"((?:1\s*2\s*3\s*4\s*5\s*6\s*7\s*8\s*9\s*0))"), "plain digits");
    });

    runner.Test("derive_keeps_separator_style", "pattern", [](TestCase& t) {
        auto spaced = MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, {"12 34 56 78"});
        t.CheckEq(DeidPatternMatcher::DerivePattern(spaced),
                  std::string(R"((?:1\s*2\s+3\s*4\s+5\s*6\s+7\s*8))"), "space separated");

        auto mixed = MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, {"+45 12-34"});
        t.CheckEq(DeidPatternMatcher::DerivePattern(mixed),
                  std::string(R"((?:\+\s*4\s*5\s+1\s*2\s*-\s*3\s*4))"), "escaped visible separators");
    });

    runner.Test("derive_orders_longest_first", "pattern", [](TestCase& t) {
        auto group = MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, {"123", "12345", "123"});
        t.CheckEq(DeidPatternMatcher::DerivePattern(group),
                  std::string(R"((?:1\s*2\s*3\s*4\s*5|1\s*2\s*3))"), "deduplicated, longest first");

        auto words = MakeGroup("<NUMBER_2>", EntityKind::PHONE_NUMBER, {"n/a"});
        t.CheckEq(DeidPatternMatcher::DerivePattern(words), std::string(""), "no digits, no pattern");
    });

    runner.Test("line_wrapped_number_matches", "pattern", [](TestCase& t) {
        Configuration config = NumberConfig({"1234567890"});
        std::vector<Deid::CompiledPattern> patterns;
        t.CheckOk(DeidPatternMatcher::Compile(config, &patterns), "compile");

        const std::string text = "call 1234567\n890 now";
        auto matches = DeidPatternMatcher::Match(text, patterns);
        t.CheckEq(matches.size(), 1u, "match count");
        if (matches.size() == 1) {
            t.CheckEq(matches[0].span.start, 5u, "start");
            t.CheckEq(matches[0].span.end, 16u, "end");
            t.Check(matches[0].span.kind == EntityKind::PHONE_NUMBER, "kind");
            t.CheckEq(matches[0].group_index, 0u, "group index");
        }
    });

    runner.Test("matches_are_digit_anchored", "pattern", [](TestCase& t) {
        Configuration config = NumberConfig({"1234567890"});
        std::vector<Deid::CompiledPattern> patterns;
        t.CheckOk(DeidPatternMatcher::Compile(config, &patterns), "compile");

        t.CheckEq(DeidPatternMatcher::Match("99912345678900", patterns).size(), 0u,
                  "inside a longer number");
        t.CheckEq(DeidPatternMatcher::Match("id:1234567890.", patterns).size(), 1u,
                  "punctuation on both sides");
        t.CheckEq(DeidPatternMatcher::MatchSpans("1234567890 and 12345 67890", patterns).size(), 2u,
                  "two occurrences");
    });

    runner.Test("match_respects_range", "pattern", [](TestCase& t) {
        Configuration config = NumberConfig({"1234567890"});
        std::vector<Deid::CompiledPattern> patterns;
        t.CheckOk(DeidPatternMatcher::Compile(config, &patterns), "compile");

        const std::string text = "1234567890 | 1234567890";
        auto matches = DeidPatternMatcher::Match(text, patterns, 11, text.size());
        t.CheckEq(matches.size(), 1u, "only the second half");
        if (!matches.empty()) t.CheckEq(matches[0].span.start, 13u, "absolute offset");
    });

    runner.Test("invalid_pattern_names_group", "pattern", [](TestCase& t) {
        Configuration config;
        auto group = MakeGroup("<NUMBER_4>", EntityKind::PHONE_NUMBER, {"42"});
        group.pattern = "([0-9";
        config.AddGroup(group);

        std::vector<Deid::CompiledPattern> patterns;
        DeidResult r = DeidPatternMatcher::Compile(config, &patterns);
        t.CheckStatus(r, DeidStatus::PATTERN_COMPILE_ERROR, "compile");
        t.CheckEq(r.entity, std::string("<NUMBER_4>"), "offending id");
        t.Check(r.message.find("([0-9") != std::string::npos, "message quotes the pattern");
    });

    runner.Test("user_pattern_on_name_group", "pattern", [](TestCase& t) {
        Configuration config;
        auto group = MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"});
        group.pattern = R"(J\.\s*Doe)";
        config.AddGroup(group);

        std::vector<Deid::CompiledPattern> patterns;
        t.CheckOk(DeidPatternMatcher::Compile(config, &patterns), "compile");
        auto spans = DeidPatternMatcher::MatchSpans("Signed, j. doe", patterns);
        t.CheckEq(spans.size(), 1u, "case-insensitive user pattern");
        if (!spans.empty()) t.Check(spans[0].kind == EntityKind::PERSON, "kind from section");
        if (!patterns.empty()) {
            t.Check(DeidPatternMatcher::FullMatch("J. Doe", patterns[0]), "full match");
            t.Check(!DeidPatternMatcher::FullMatch("J. Doe Jr", patterns[0]), "partial is not full");
        }
    });

    runner.Test("literal_tolerates_case_and_wrapping", "pattern", [](TestCase& t) {
        const std::string text = "Hi john\n  DOE and JohnDoe, John Does";
        auto found = DeidPatternMatcher::FindLiteral(text, "John Doe");
        t.CheckEq(found.size(), 1u, "only the word-anchored occurrence");
        if (!found.empty()) {
            t.CheckEq(found[0].first, 3u, "start");
            t.CheckEq(found[0].second, 13u, "end");
        }
        t.CheckEq(DeidPatternMatcher::FindLiteral(text, "   ").size(), 0u, "blank variant");
    });

    runner.Test("literal_non_alphanumeric_edges", "pattern", [](TestCase& t) {
        auto found = DeidPatternMatcher::FindLiteral("mail <john@x.org>, john@x.org.", "john@x.org");
        t.CheckEq(found.size(), 2u, "both occurrences");
    });

    runner.Test("escape_regex", "pattern", [](TestCase& t) {
        t.CheckEq(DeidPatternMatcher::EscapeRegex("a.b(c)+"), std::string(R"(a\.b\(c\)\+)"), "escaped");
        t.CheckEq(DeidPatternMatcher::EscapeRegex("-/ "), std::string("-/ "), "untouched");
    });
}
