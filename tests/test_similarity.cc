#include "deid_tests.h"
#include "ai/deid_text_similarity_scorer.h"

using Deid::EntityKind;

void RunSimilarityTests(TestRunner& runner) {
    const TextSimilarityScorer* scorer = TextSimilarityScorer::GetInstance();

    runner.Test("normalize_text_folds_case_and_whitespace", "similarity", [&](TestCase& t) {
        t.CheckEq(TextSimilarityScorer::NormalizeText("  John \n  DOE "), std::string("john doe"),
                  "collapsed");
        t.CheckEq(TextSimilarityScorer::NormalizeText("\t\n"), std::string(""), "blank");
    });

    runner.Test("normalize_name_folds_danish_letters", "similarity", [&](TestCase& t) {
        t.CheckEq(TextSimilarityScorer::NormalizeName("Jens-Ole \xC3\x86r\xC3\xB8"),
                  std::string("jensole aeroe"), "Jens-Ole Æro");
        t.CheckEq(TextSimilarityScorer::NormalizeName("S\xC3\xB8ren Kierkeg\xC3\xA5rd"),
                  std::string("soeren kierkegaard"), "Søren Kierkegård");
    });

    runner.Test("normalize_number_keeps_digits", "similarity", [&](TestCase& t) {
        t.CheckEq(TextSimilarityScorer::NormalizeNumber("+45 12-34 56.78"), std::string("4512345678"),
                  "digits");
        t.CheckEq(scorer->Normalize("12 34\n56 78", EntityKind::PHONE_NUMBER),
                  std::string("12345678"), "dispatch");
    });

    runner.Test("indel_ratio_bounds", "similarity", [&](TestCase& t) {
        t.CheckNear(scorer->IndelRatio("abc", "abc"), 1.0, 1e-6, "identical");
        t.CheckNear(scorer->IndelRatio("", ""), 1.0, 1e-6, "both empty");
        t.CheckNear(scorer->IndelRatio("abc", "xyz"), 0.0, 1e-6, "disjoint");
        t.CheckEq(scorer->IndelDistance("abcd", "abd"), 1, "one deletion");
        t.CheckEq(scorer->IndelDistance("abc", "abd"), 2, "substitution costs two");
    });

    runner.Test("near_duplicate_names_score_high", "similarity", [&](TestCase& t) {
        // "john doe" vs "jon doe": distance 1 over 15 characters
        t.CheckNear(scorer->Score("John Doe", "Jon Doe", EntityKind::PERSON), 1.0 - 1.0 / 15.0, 1e-5,
                    "John/Jon");
        t.CheckNear(scorer->Score("Jane Smith", "Jane Smyth", EntityKind::PERSON), 0.9, 1e-5,
                    "Smith/Smyth");
        t.CheckNear(scorer->Score("John Doe", "JOHN  DOE", EntityKind::PERSON), 1.0, 1e-6,
                    "case and spacing");
    });

    runner.Test("unrelated_names_score_low", "similarity", [&](TestCase& t) {
        t.Check(scorer->Score("Jane Smith", "John Doe", EntityKind::PERSON) < 0.85f,
                "Jane Smith vs John Doe below threshold");
    });

    runner.Test("numbers_compare_digits_only", "similarity", [&](TestCase& t) {
        t.CheckNear(scorer->Score("1234567890", "123 456 7890", EntityKind::PHONE_NUMBER), 1.0, 1e-6,
                    "separators ignored");
        t.CheckNear(scorer->Score("no digits", "1234", EntityKind::PHONE_NUMBER), 0.0, 1e-6,
                    "empty digit string");
    });

    runner.Test("best_match_over_variants", "similarity", [&](TestCase& t) {
        std::vector<std::string> variants = {"Jane Smith", "John Doe"};
        t.CheckNear(scorer->ScoreBestMatch("JOHN DOE", variants, EntityKind::PERSON), 1.0, 1e-6,
                    "exact after normalization");
        t.CheckNear(scorer->ScoreBestMatch("anything", {}, EntityKind::PERSON), 0.0, 1e-6,
                    "no variants");
    });
}
