#include "deid_tests.h"
#include "test_helpers.h"
#include "core/deid_config_reconciler.h"
#include "core/deid_pattern_matcher.h"

using Deid::Configuration;
using Deid::DeidConfigReconciler;
using Deid::EntityGroup;
using Deid::EntityKind;
using Deid::GroupsByKind;
using Deid::ReconcileStats;

namespace {

Configuration PeopleConfig() {
    Configuration config;
    config.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));
    config.AddGroup(MakeGroup("<PERSON_2>", EntityKind::PERSON, {"Jane Smith"}));
    return config;
}

EntityGroup Fresh(EntityKind kind, const std::vector<std::string>& variants) {
    return MakeGroup("", kind, variants);
}

}  // namespace

void RunReconcilerTests(TestRunner& runner) {
    runner.Test("ids_minted_in_order", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PERSON] = {Fresh(EntityKind::PERSON, {"John Doe", "Jon Doe"}),
                                     Fresh(EntityKind::PERSON, {"Jane Smith"})};
        fresh[EntityKind::PHONE_NUMBER] = {Fresh(EntityKind::PHONE_NUMBER, {"1234567890"})};

        Configuration out;
        ReconcileStats stats;
        t.CheckOk(reconciler.Reconcile(Configuration(), fresh, &out, &stats), "reconcile");
        const auto& names = out.Groups(EntityKind::PERSON);
        t.CheckEq(names.size(), 2u, "names");
        if (names.size() == 2) {
            t.CheckEq(names[0].id, std::string("<PERSON_1>"), "first id");
            t.CheckEq(names[1].id, std::string("<PERSON_2>"), "second id");
        }
        const auto& numbers = out.Groups(EntityKind::PHONE_NUMBER);
        t.CheckEq(numbers.size(), 1u, "numbers");
        if (!numbers.empty()) {
            t.CheckEq(numbers[0].id, std::string("<NUMBER_1>"), "number id");
            t.Check(numbers[0].pattern.has_value(), "derived pattern attached");
        }
        t.CheckEq(stats.groups_added, 3, "groups added");
        t.CheckEq(stats.variants_added, 4, "variants added");
    });

    runner.Test("similar_fresh_group_extends_existing", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PERSON] = {Fresh(EntityKind::PERSON, {"JOHN DOE", "Jon Doe"})};

        Configuration out;
        ReconcileStats stats;
        t.CheckOk(reconciler.Reconcile(PeopleConfig(), fresh, &out, &stats), "reconcile");
        const auto& names = out.Groups(EntityKind::PERSON);
        t.CheckEq(names.size(), 2u, "no new group");
        if (!names.empty()) {
            std::vector<std::string> expected = {"John Doe", "JOHN DOE", "Jon Doe"};
            t.Check(names[0].variants == expected, "variants appended after the existing one");
        }
        t.CheckEq(stats.groups_added, 0, "groups added");
        t.CheckEq(stats.groups_extended, 1, "groups extended");
    });

    runner.Test("new_entity_gets_next_suffix", "reconciler", [](TestCase& t) {
        Configuration existing;
        existing.AddGroup(MakeGroup("<PERSON_1>", EntityKind::PERSON, {"John Doe"}));
        existing.AddGroup(MakeGroup("<PERSON_7>", EntityKind::PERSON, {"Jane Smith"}));

        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PERSON] = {Fresh(EntityKind::PERSON, {"Alice Wonder"})};
        Configuration out;
        t.CheckOk(reconciler.Reconcile(existing, fresh, &out), "reconcile");
        t.Check(out.FindById("<PERSON_8>") != nullptr, "max suffix + 1");
        t.CheckEq(existing.Groups(EntityKind::PERSON).size(), 2u, "input left untouched");
    });

    runner.Test("deleted_ids_are_not_reissued", "reconciler", [](TestCase& t) {
        Configuration existing = PeopleConfig();
        existing.SetWatermark(EntityKind::PERSON, 5);

        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PERSON] = {Fresh(EntityKind::PERSON, {"Alice Wonder"})};
        Configuration out;
        t.CheckOk(reconciler.Reconcile(existing, fresh, &out), "reconcile");
        t.Check(out.FindById("<PERSON_6>") != nullptr, "suffix above the watermark");
        t.CheckEq(out.Watermark(EntityKind::PERSON), 6, "watermark raised");
    });

    runner.Test("reconcile_is_idempotent", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PERSON] = {Fresh(EntityKind::PERSON, {"Jon Doe"}),
                                     Fresh(EntityKind::PERSON, {"Alice Wonder"})};
        fresh[EntityKind::PHONE_NUMBER] = {Fresh(EntityKind::PHONE_NUMBER, {"12 34 56 78"})};

        Configuration once, twice;
        t.CheckOk(reconciler.Reconcile(PeopleConfig(), fresh, &once), "first");
        ReconcileStats stats;
        t.CheckOk(reconciler.Reconcile(once, fresh, &twice, &stats), "second");
        t.Check(once == twice, "same configuration");
        t.Check(!stats.Changed(), "second pass changes nothing");
    });

    runner.Test("fresh_id_merges_by_identity", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PERSON] = {MakeGroup("<PERSON_2>", EntityKind::PERSON, {"J. S."})};
        Configuration out;
        t.CheckOk(reconciler.Reconcile(PeopleConfig(), fresh, &out), "reconcile");
        const auto* group = out.FindById("<PERSON_2>");
        t.Check(group != nullptr && group->HasVariant("J. S."), "joined by id despite low similarity");
        t.CheckEq(out.Groups(EntityKind::PERSON).size(), 2u, "no new group");
    });

    runner.Test("variant_of_another_group_is_not_copied", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PERSON] = {MakeGroup("<PERSON_1>", EntityKind::PERSON,
                                               {"Johnny Doe", "jane  smith"})};
        Configuration out;
        ReconcileStats stats;
        t.CheckOk(reconciler.Reconcile(PeopleConfig(), fresh, &out, &stats), "reconcile");
        const auto* john = out.FindById("<PERSON_1>");
        t.Check(john && john->variants == std::vector<std::string>({"John Doe", "Johnny Doe"}),
                "only the unclaimed variant joins");
        const auto* jane = out.FindById("<PERSON_2>");
        t.Check(jane && jane->variants == std::vector<std::string>({"Jane Smith"}), "owner untouched");
        t.CheckEq(stats.variants_added, 1, "variants added");
    });

    runner.Test("id_used_by_another_section_is_rejected", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::EMAIL] = {MakeGroup("<PERSON_1>", EntityKind::EMAIL, {"john@example.com"})};
        Configuration out;
        DeidResult r = reconciler.Reconcile(PeopleConfig(), fresh, &out);
        t.CheckStatus(r, DeidStatus::CONFIG_VALIDATION_ERROR, "reconcile");
        t.CheckEq(r.entity, std::string("<PERSON_1>"), "offending id");
    });

    runner.Test("fresh_group_without_variants_is_rejected", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::ADDRESS] = {Fresh(EntityKind::ADDRESS, {})};
        Configuration out = PeopleConfig();
        DeidResult r = reconciler.Reconcile(Configuration(), fresh, &out);
        t.CheckStatus(r, DeidStatus::CONFIG_VALIDATION_ERROR, "reconcile");
        t.CheckEq(out.Groups(EntityKind::PERSON).size(), 2u, "output untouched on failure");
    });

    runner.Test("user_pattern_survives_derived_is_refreshed", "reconciler", [](TestCase& t) {
        Configuration existing;
        auto edited = MakeGroup("<NUMBER_1>", EntityKind::PHONE_NUMBER, {"1234567890"});
        edited.pattern = R"(\d{10})";
        existing.AddGroup(edited);
        auto derived = MakeGroup("<NUMBER_2>", EntityKind::PHONE_NUMBER, {"5551234"});
        derived.pattern = Deid::DeidPatternMatcher::DerivePattern(derived);
        existing.AddGroup(derived);

        DeidConfigReconciler reconciler;
        GroupsByKind fresh;
        fresh[EntityKind::PHONE_NUMBER] = {Fresh(EntityKind::PHONE_NUMBER, {"123 456 7890"}),
                                           Fresh(EntityKind::PHONE_NUMBER, {"555-1234"})};
        Configuration out;
        t.CheckOk(reconciler.Reconcile(existing, fresh, &out), "reconcile");

        const auto* first = out.FindById("<NUMBER_1>");
        const auto* second = out.FindById("<NUMBER_2>");
        t.Check(first && second, "both groups present");
        if (!first || !second) return;
        t.CheckEq(first->variants.size(), 2u, "edited group extended");
        t.CheckEq(*first->pattern, std::string(R"(\d{10})"), "edited pattern kept");
        t.CheckEq(*second->pattern, Deid::DeidPatternMatcher::DerivePattern(*second),
                  "derived pattern covers the new variant");
        t.CheckEq(out.Groups(EntityKind::PHONE_NUMBER).size(), 2u, "no new group");
    });

    runner.Test("assign_inline", "reconciler", [](TestCase& t) {
        DeidConfigReconciler reconciler;
        Configuration config = PeopleConfig();
        ReconcileStats stats;
        std::string id;

        t.CheckOk(reconciler.Assign(&config, EntityKind::PERSON, "Jon Doe", &id, &stats), "near");
        t.CheckEq(id, std::string("<PERSON_1>"), "near duplicate joins");
        t.Check(config.FindById("<PERSON_1>")->HasVariant("Jon Doe"), "variant recorded");

        t.CheckOk(reconciler.Assign(&config, EntityKind::PERSON, "Bob Marley", &id, &stats), "new");
        t.CheckEq(id, std::string("<PERSON_3>"), "new group");

        t.CheckOk(reconciler.Assign(&config, EntityKind::PERSON, "Bob Marley", &id, &stats), "again");
        t.CheckEq(id, std::string("<PERSON_3>"), "stable on repeat");

        t.CheckEq(stats.groups_added, 1, "one group added");
        t.CheckEq(stats.variants_added, 2, "Jon Doe and Bob Marley");
    });
}
