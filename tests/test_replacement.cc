#include "deid_tests.h"
#include "test_helpers.h"
#include "ai/deid_rule_recognizer.h"
#include "core/deid_config_reconciler.h"
#include "core/deid_pattern_matcher.h"
#include "core/deid_replacement_engine.h"

using Deid::Configuration;
using Deid::DeidBuiltinSegmenter;
using Deid::DeidConfigReconciler;
using Deid::DeidReplacementEngine;
using Deid::EntityKind;
using Deid::FormatKind;
using Deid::ReplacementStats;

namespace {

// {John Doe, Jon Doe, john DOE} -> <PERSON_1>, {Jane Smith, Jane Smyth} -> <PERSON_2>,
// {1234567890, 12 34 56 78} -> <NUMBER_1>
Configuration ContactConfig(bool with_pattern) {
    Configuration config;
    config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe", "Jon Doe", "john DOE"}));
    config.AddGroup(MakeGroup("<PERSON_2>", EntityKind::PERSON, {"Jane Smith", "Jane Smyth"}));
    auto number = MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, {"1234567890", "12 34 56 78"});
    if (with_pattern) number.pattern = Deid::DeidPatternMatcher::DerivePattern(number);
    config.AddGroup(number);
    return config;
}

}  // namespace

void RunReplacementTests(TestRunner& runner) {
    const DeidBuiltinSegmenter segmenter;
    const DeidConfigReconciler reconciler;

    runner.Test("mixed_sentence", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config = ContactConfig(false);
        std::string out;
        ReplacementStats stats;
        t.CheckOk(engine.Anonymize("Contact John Doe at 1234567890 or Jane Smith via 12 34 56 78.",
                                   FormatKind::TEXT, &config, &out, &stats), "anonymize");
        t.CheckEq(out, std::string("Contact <PERSON_1> at <NUMBER_1> or <PERSON_2> via <NUMBER_1>."),
                  "output");
        t.CheckEq(stats.TotalReplaced(), 4, "replacements");
        t.CheckEq(stats.literal_replaced, 4, "all literal");
        t.CheckEq(stats.by_kind[EntityKind::PERSON].replaced, 2, "names");
        t.CheckEq(stats.by_kind[EntityKind::PHONE_NUMBER].replaced, 2, "numbers");
    });

    runner.Test("line_wrapped_number", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config = ContactConfig(true);
        std::string out;
        ReplacementStats stats;
        t.CheckOk(engine.Anonymize("Call 1234567\n890 today", FormatKind::TEXT, &config, &out, &stats),
                  "anonymize");
        t.CheckEq(out, std::string("Call <NUMBER_1> today"), "output");
        t.CheckEq(stats.pattern_replaced, 1, "matched by the derived pattern");
    });

    runner.Test("mixed_case_mention", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config = ContactConfig(false);
        std::string out;
        t.CheckOk(engine.Anonymize("Met JOHN doe, then john DOE\nand John\n  Doe.", FormatKind::TEXT,
                                   &config, &out), "anonymize");
        t.CheckEq(out, std::string("Met <PERSON_1>, then <PERSON_1>\nand <PERSON_1>."), "output");
    });

    runner.Test("second_pass_is_a_no_op", "replacement", [&](TestCase& t) {
        FakeRecognizer recognizer;
        recognizer.Add("Alice Wonder", EntityKind::PERSON);
        recognizer.Add("PERSON", EntityKind::PERSON);
        DeidReplacementEngine engine(&recognizer, &segmenter, &reconciler);
        Configuration config = ContactConfig(true);

        std::string once, twice;
        t.CheckOk(engine.Anonymize("Contact John Doe at 1234567890 or Alice Wonder via 12 34 56 78.",
                                   FormatKind::TEXT, &config, &once), "first");
        const size_t groups = config.TotalGroups();
        t.CheckOk(engine.Anonymize(once, FormatKind::TEXT, &config, &twice), "second");
        t.CheckEq(twice, once, "unchanged");
        t.CheckEq(config.TotalGroups(), groups, "id tokens are never learned as entities");
    });

    runner.Test("names_beside_replaced_variants", "replacement", [&](TestCase& t) {
        Deid::DeidRuleRecognizer recognizer;
        DeidReplacementEngine engine(&recognizer, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"Peter Hansen"}));
        config.AddGroup(MakeGroup("<PERSON_2>", EntityKind::PERSON, {"Anna Marie"}));

        // Four capitalized words are not a name until the configured pair becomes an id
        std::string once, twice;
        ReplacementStats stats;
        t.CheckOk(engine.Anonymize("Peter Hansen Larsen Berg signed. Call Anna Marie Jensen Holm today.",
                                   FormatKind::TEXT, &config, &once, &stats), "first");
        t.CheckEq(once, std::string("<PERSON_1> <PERSON_3> signed. Call <PERSON_2> <PERSON_4> today."),
                  "output");
        t.CheckEq(stats.literal_replaced, 2, "configured names");
        t.CheckEq(stats.recognizer_replaced, 2, "names found beside them");
        t.CheckEq(stats.reconcile.groups_added, 2, "groups minted");

        const size_t groups = config.TotalGroups();
        t.CheckOk(engine.Anonymize(once, FormatKind::TEXT, &config, &twice), "second");
        t.CheckEq(twice, once, "second pass unchanged");
        t.CheckEq(config.TotalGroups(), groups, "nothing new learned");
    });

    runner.Test("mentions_inside_configured_variants_are_skipped", "replacement", [&](TestCase& t) {
        Deid::DeidRuleRecognizer recognizer;
        DeidReplacementEngine engine(&recognizer, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<ADDRESS_1>", EntityKind::ADDRESS, {"Flat 2, 42 Baker Street"}));
        const std::string doc = "She lives at Flat 2, 42 Baker Street now.";

        std::vector<Deid::Span> mentions;
        t.CheckOk(engine.CollectMentions(doc, FormatKind::TEXT, config, "doc", &mentions), "collect");
        t.CheckEq(mentions.size(), 0u, "street covered by the configured address");

        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"Peter Hansen"}));
        const Configuration before = config;
        t.CheckOk(engine.CollectMentions("Peter Hansen Larsen Berg signed.", FormatKind::TEXT, config,
                                         "doc", &mentions), "collect beside a variant");
        t.CheckEq(mentions.size(), 1u, "one mention");
        if (!mentions.empty()) {
            t.CheckEq(mentions[0].text, std::string("Larsen Berg"), "mention text");
            t.CheckEq(mentions[0].start, 13u, "offset in the original document");
            t.CheckEq(mentions[0].file_id, std::string("doc"), "file id");
        }
        t.Check(config == before, "configuration untouched");

        std::string out;
        t.CheckOk(engine.Anonymize(doc, FormatKind::TEXT, &config, &out), "anonymize");
        t.CheckEq(out, std::string("She lives at <ADDRESS_1> now."), "output");
    });

    runner.Test("new_person_gets_next_id", "replacement", [&](TestCase& t) {
        FakeRecognizer recognizer;
        recognizer.Add("Alice Wonder", EntityKind::PERSON);
        recognizer.Add("John Doe", EntityKind::PERSON);
        DeidReplacementEngine engine(&recognizer, &segmenter, &reconciler);

        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));
        config.AddGroup(MakeGroup("<PERSON_7>", EntityKind::PERSON, {"Jane Smith"}));

        std::string out;
        ReplacementStats stats;
        t.CheckOk(engine.Anonymize("Alice Wonder met John Doe. Alice Wonder left.", FormatKind::TEXT,
                                   &config, &out, &stats), "anonymize");
        t.CheckEq(out, std::string("<PERSON_8> met <PERSON_1>. <PERSON_8> left."), "output");
        t.Check(config.FindById("<PERSON_8>") != nullptr, "configuration extended");
        t.CheckEq(stats.reconcile.groups_added, 1, "one group minted");
        t.CheckEq(stats.by_kind[EntityKind::PERSON].found, 3, "recognizer mentions");
        t.CheckEq(stats.recognizer_replaced, 2, "Alice twice");
        t.CheckEq(stats.literal_replaced, 1, "John Doe by literal");
    });

    runner.Test("recognized_variant_maps_to_group", "replacement", [&](TestCase& t) {
        FakeRecognizer recognizer;
        recognizer.Add("123-456-7890", EntityKind::PHONE_NUMBER);
        recognizer.Add("Jon  Doe", EntityKind::PERSON);
        DeidReplacementEngine engine(&recognizer, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));
        config.AddGroup(MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, {"1234567890"}));

        std::string out;
        t.CheckOk(engine.Anonymize("Jon  Doe: 123-456-7890", FormatKind::TEXT, &config, &out),
                  "anonymize");
        t.CheckEq(out, std::string("<PERSON_1>: <NUMBER_1>"), "fuzzy and digit-equal mapping");
        t.CheckEq(config.Groups(EntityKind::PERSON).size(), 1u, "no new person");
        t.CheckEq(config.Groups(EntityKind::PHONE_NUMBER).size(), 1u, "no new number");
    });

    runner.Test("longest_match_wins", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));
        config.AddGroup(MakeGroup("<PERSON_2>", EntityKind::PERSON, {"John Doe Jr"}));

        std::string out;
        t.CheckOk(engine.Anonymize("John Doe Jr called John Doe.", FormatKind::TEXT, &config, &out),
                  "anonymize");
        t.CheckEq(out, std::string("<PERSON_2> called <PERSON_1>."), "output");
    });

    runner.Test("earlier_start_wins_partial_overlap", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"Anna Berg"}));
        config.AddGroup(MakeGroup("<ADDRESS_1>", EntityKind::ADDRESS, {"Berg Street 5"}));

        std::string out;
        ReplacementStats stats;
        t.CheckOk(engine.Anonymize("Anna Berg Street 5", FormatKind::TEXT, &config, &out, &stats),
                  "anonymize");
        t.CheckEq(out, std::string("<PERSON_1> Street 5"), "no overlapping replacement");
        t.CheckEq(stats.TotalReplaced(), 1, "one replacement");
    });

    runner.Test("words_inside_words_untouched", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config = ContactConfig(true);
        const std::string doc = "Jon Doesburg called 91234567890 and 123456789012.";
        std::string out;
        t.CheckOk(engine.Anonymize(doc, FormatKind::TEXT, &config, &out), "anonymize");
        t.CheckEq(out, doc, "unchanged");
    });

    runner.Test("markdown_syntax_preserved", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));
        config.AddGroup(MakeGroup("<EMAIL_1>", EntityKind::EMAIL, {"john@x.org"}));

        std::string out;
        t.CheckOk(engine.Anonymize(
            "[John Doe](https://x.org/John%20Doe?ref=john@x.org) wrote from <mailto:john@x.org>\n",
            FormatKind::MARKDOWN, &config, &out), "anonymize");
        t.CheckEq(out, std::string(
            "[<PERSON_1>](https://x.org/John%20Doe?ref=john@x.org) wrote from <mailto:<EMAIL_1>>\n"),
            "output");
    });

    runner.Test("tex_arguments_preserved", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));

        std::string out;
        t.CheckOk(engine.Anonymize("\\section{John Doe}\\label{sec:John Doe}\n\\emph{John Doe}\n",
                                   FormatKind::TEX, &config, &out), "anonymize");
        t.CheckEq(out, std::string("\\section{<PERSON_1>}\\label{sec:John Doe}\n\\emph{<PERSON_1>}\n"),
                  "output");
    });

    runner.Test("bibtex_fields_replaced", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config;
        config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));

        std::string out;
        t.CheckOk(engine.Anonymize("@misc{John,\n  author = {John Doe},\n}\n", FormatKind::BIBTEX,
                                   &config, &out), "anonymize");
        t.CheckEq(out, std::string("@misc{John,\n  author = {<PERSON_1>},\n}\n"), "output");
    });

    runner.Test("malformed_document_yields_no_output", "replacement", [&](TestCase& t) {
        DeidReplacementEngine engine(nullptr, &segmenter, &reconciler);
        Configuration config = ContactConfig(false);
        std::string out = "stale";
        DeidResult r = engine.Anonymize("@article{key,\n  author {John Doe}\n}\n", FormatKind::BIBTEX,
                                        &config, &out);
        t.CheckStatus(r, DeidStatus::FORMAT_PARSE_ERROR, "anonymize");
        t.Check(out.empty(), "no output");
    });

    runner.Test("recognizer_failure_aborts_document", "replacement", [&](TestCase& t) {
        FakeRecognizer recognizer;
        recognizer.SetFailure(true);
        DeidReplacementEngine engine(&recognizer, &segmenter, &reconciler);
        Configuration config = ContactConfig(false);
        std::string out;
        DeidResult r = engine.Anonymize("John Doe", FormatKind::TEXT, &config, &out);
        t.CheckStatus(r, DeidStatus::RECOGNITION_ERROR, "anonymize");
        t.Check(out.empty(), "no output");
    });

    runner.Test("recognizer_sees_content_only", "replacement", [&](TestCase& t) {
        FakeRecognizer recognizer;
        recognizer.Add("Anna Berg", EntityKind::PERSON);
        DeidReplacementEngine engine(&recognizer, &segmenter, &reconciler);
        Configuration config;
        std::string out;
        t.CheckOk(engine.Anonymize("\\label{Anna Berg} Anna Berg\n", FormatKind::TEX, &config, &out),
                  "anonymize");
        t.CheckEq(out, std::string("\\label{Anna Berg} <PERSON_1>\n"), "output");
    });

    runner.Test("id_tokens_found", "replacement", [](TestCase& t) {
        Configuration config;
        config.AddGroup(MakeGroup("[CLIENT]", EntityKind::PERSON, {"John Doe"}));
        auto tokens = DeidReplacementEngine::FindIdTokens("<PERSON_12> and [CLIENT] <lower_1>", config);
        t.CheckEq(tokens.size(), 2u, "generic token and configured id");
        if (tokens.size() == 2) {
            t.CheckEq(tokens[0].first, 0u, "first token start");
            t.CheckEq(tokens[0].second, 11u, "first token end");
            t.CheckEq(tokens[1].first, 16u, "configured id start");
        }
    });
}
