#include <boost/test/unit_test.hpp>

#include <nlohmann/json.hpp>

#include "config.h"
#include "errors.h"
#include "matching_io.h"
#include "problem_parser.h"
#include "solver.h"
#include "test_helpers.h"

using json = nlohmann::json;
using namespace blm;
using namespace blm_test;

BOOST_AUTO_TEST_SUITE(matching_records)

BOOST_AUTO_TEST_CASE(record_reads_back_regardless_of_match_order)
{
    const json written = matching_to_json(MatchingRecord{
        Variant::kRankedTies,
        make_matching({{"Thomas", "Swapneel"}, {"Cindy", "Zora"}, {"Ishaan", "Kevin"}}),
        std::nullopt});
    BOOST_TEST(written.at("variant").get<std::string>() == "RankedTies");
    BOOST_TEST(written.at("objective_value").is_null());
    BOOST_TEST(written.at("matches").size() == 3u);

    // same pairs listed in a different order
    const json shuffled = json::parse(R"({
        "variant": "RankedTies",
        "matches": [{"proposer": "Ishaan", "receiver": "Kevin"},
                    {"proposer": "Thomas", "receiver": "Swapneel"},
                    {"proposer": "Cindy", "receiver": "Zora"}],
        "objective_value": null})");
    const MatchingRecord a = matching_from_json(written);
    const MatchingRecord b = matching_from_json(shuffled);
    BOOST_CHECK(a.variant == Variant::kRankedTies);
    BOOST_CHECK(a.matching == b.matching);
    BOOST_TEST(!b.objective_value.has_value());
}

BOOST_AUTO_TEST_CASE(weighted_record_keeps_its_objective)
{
    Matching m = make_matching({{"Cindy", "Zora"}, {"Cindy", "Morgan"}});
    const MatchingRecord back = matching_from_json(
        matching_to_json(MatchingRecord{Variant::kWeightedOptimize, m, 5.5}));
    BOOST_CHECK(back.variant == Variant::kWeightedOptimize);
    BOOST_REQUIRE(back.objective_value.has_value());
    BOOST_TEST(*back.objective_value == 5.5);
    BOOST_TEST(back.matching.partners_of_proposer("Cindy").size() == 2u);
}

BOOST_AUTO_TEST_CASE(malformed_records_are_rejected)
{
    BOOST_CHECK_THROW(matching_from_json(json::array()), InvalidInputError);
    BOOST_CHECK_THROW(matching_from_json(json::parse(R"({"matches": []})")), InvalidInputError);
    BOOST_CHECK_THROW(matching_from_json(json::parse(R"({"variant": "Roommates", "matches": []})")),
                      InvalidInputError);
    BOOST_CHECK_THROW(matching_from_json(json::parse(R"({"variant": "smp", "matches": {}})")), InvalidInputError);
    BOOST_CHECK_THROW(matching_from_json(json::parse(R"({"variant": "smp", "matches": [{"proposer": "A"}]})")),
                      InvalidInputError);
    BOOST_CHECK_THROW(matching_from_json(json::parse(R"({"variant": "smp", "matches": [
                          {"proposer": "A", "receiver": "X"}, {"proposer": "A", "receiver": "X"}]})")),
                      InvalidInputError);
}

BOOST_AUTO_TEST_CASE(result_carries_blocking_pairs_and_meta)
{
    SolveResult r;
    r.matching = make_matching({{"Ishaan", "Kevin"}});
    r.blocking_pairs.insert(BlockingPair{"Ishaan", "Swapneel"});
    r.engine = Engine::kDeferredAcceptance;

    const json j = result_to_json(Variant::kTotalOrder, r);
    BOOST_TEST(j.at("blocking_pairs").size() == 1u);
    BOOST_TEST(j.at("blocking_pairs")[0].at("receiver").get<std::string>() == "Swapneel");
    BOOST_TEST(j.at("meta").at("stable").get<bool>() == false);
    BOOST_TEST(j.at("meta").at("engine").get<std::string>() == std::string(engine_tag(Engine::kDeferredAcceptance)));
    // the record part still reads back on its own
    BOOST_CHECK(matching_from_json(j).matching == r.matching);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(problem_files)

BOOST_AUTO_TEST_CASE(partial_problem_file_solves_like_the_builtin)
{
    const json j = json::parse(R"({
        "bigs": {"Ishaan": {"max": 1}, "Cindy": {"max": 1}, "Thomas": {"max": 1}},
        "littles": {"Swapneel": {"max": 1}, "Zora": {"max": 1}, "Kevin": {"max": 1}},
        "big_prefs": {
            "Ishaan": {"Swapneel": 1, "Zora": 1},
            "Cindy": {"Swapneel": 3, "Kevin": 1, "Zora": 2},
            "Thomas": {"Swapneel": 1, "Kevin": 2}},
        "little_prefs": {
            "Swapneel": {"Ishaan": 2, "Thomas": 1},
            "Zora": {"Ishaan": 3, "Cindy": 1, "Thomas": 2},
            "Kevin": {"Ishaan": 1, "Cindy": 1}}})");

    const MatchingProblem p = problem_from_json(j, Variant::kPartialTies);
    BOOST_TEST(p.proposers.size() == 3u);
    BOOST_CHECK(p.proposer_prefs.at("Ishaan").kind == PreferenceKind::kPartialRanked);

    const SolveResult r = solve(Variant::kPartialTies, p);
    BOOST_CHECK(r.matching == make_matching({{"Cindy", "Kevin"}, {"Ishaan", "Zora"}, {"Thomas", "Swapneel"}}));
}

BOOST_AUTO_TEST_CASE(arrays_and_capacities)
{
    const json j = json::parse(R"({
        "bigs": {"Cindy": {"max": 2}, "Thomas": {}},
        "littles": ["Zora", "Kevin"],
        "big_prefs": {"Cindy": ["Zora", "Kevin"], "Thomas": ["Kevin", "Zora"]},
        "little_prefs": {"Zora": ["Cindy", "Thomas"], "Kevin": ["Thomas", "Cindy"]}})");

    const MatchingProblem p = problem_from_json(j, Variant::kWeightedOptimize);
    BOOST_REQUIRE(p.proposers.size() == 2u);
    for (const auto& b : p.proposers)
        BOOST_TEST(b.capacity == (b.id == "Cindy" ? 2 : 1));
    BOOST_TEST(p.receivers.size() == 2u);
    BOOST_CHECK(p.receiver_prefs.at("Kevin").kind == PreferenceKind::kTotalOrder);

    // complete-list variants read rank maps as ties, not partial lists
    const json ties = json::parse(R"({
        "bigs": ["A"], "littles": ["X"],
        "big_prefs": {"A": {"X": 1}}, "little_prefs": {"X": {"A": 1}}})");
    BOOST_CHECK(problem_from_json(ties, Variant::kRankedTies).proposer_prefs.at("A").kind ==
                PreferenceKind::kRankedTies);

    // problem_to_json writes what problem_from_json reads
    const MatchingProblem again = problem_from_json(problem_to_json(p), Variant::kWeightedOptimize);
    BOOST_TEST(again.proposers.size() == 2u);
    BOOST_TEST(again.proposer_prefs.at("Thomas").order.front() == "Kevin");
}

BOOST_AUTO_TEST_CASE(shape_errors)
{
    BOOST_CHECK_THROW(problem_from_json(json::parse(R"({"bigs": []})"), Variant::kTotalOrder), InvalidInputError);
    BOOST_CHECK_THROW(problem_from_json(json::parse(R"({"bigs": 3, "littles": [], "big_prefs": {},
                          "little_prefs": {}})"), Variant::kTotalOrder),
                      InvalidInputError);
    BOOST_CHECK_THROW(problem_from_json(json::parse(R"({"bigs": ["A"], "littles": ["X"],
                          "big_prefs": {"A": {"X": "first"}}, "little_prefs": {}})"), Variant::kRankedTies),
                      InvalidInputError);
    BOOST_CHECK_THROW(problem_from_json(json::parse(R"({"bigs": {"A": {"max": 1.5}}, "littles": ["X"],
                          "big_prefs": {}, "little_prefs": {}})"), Variant::kWeightedOptimize),
                      InvalidInputError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(config_and_tags)

BOOST_AUTO_TEST_CASE(config_overrides_defaults)
{
    const Cfg c = parse_config(json::parse(R"({
        "TIME_LIMIT_SECONDS": 5, "NUM_WORKERS": 4, "PREFERENCE_WEIGHT": 0.25,
        "ENFORCE_EXACTLY_ONE": true, "ENGINE": "cpsat", "RESULT_OUT": "out.json",
        "FORCED_PAIRS": [["Ishaan", "Zora"]]})"));
    BOOST_TEST(c.solve.time_limit_seconds == 5);
    BOOST_TEST(c.solve.num_workers == 4);
    BOOST_TEST(c.solve.weight == 0.25);
    BOOST_TEST(c.solve.enforce_exactly_one);
    BOOST_CHECK(c.solve.engine == Engine::kConstraintBackend);
    BOOST_TEST(c.result_out == "out.json");
    BOOST_REQUIRE(c.solve.forced_pairs.size() == 1u);
    BOOST_TEST(c.solve.forced_pairs[0].receiver == "Zora");

    const Cfg d = parse_config(json::object());
    BOOST_TEST(d.solve.weight == 0.5);
    BOOST_CHECK(d.solve.engine == Engine::kAuto);
    BOOST_TEST(d.result_out.empty());
}

BOOST_AUTO_TEST_CASE(config_errors)
{
    BOOST_CHECK_THROW(parse_config(json::parse(R"({"TIME_LIMIT_SECONDS": -1})")), InvalidInputError);
    BOOST_CHECK_THROW(parse_config(json::parse(R"({"ENGINE": "simplex"})")), InvalidInputError);
    BOOST_CHECK_THROW(parse_config(json::parse(R"({"NUM_WORKERS": "many"})")), InvalidInputError);
    BOOST_CHECK_THROW(parse_config(json::parse(R"({"FORCED_PAIRS": [["Ishaan"]]})")), InvalidInputError);
    BOOST_CHECK_THROW(parse_config(json::array()), InvalidInputError);
}

BOOST_AUTO_TEST_CASE(variant_names)
{
    BOOST_CHECK(parse_variant("smp") == Variant::kTotalOrder);
    BOOST_CHECK(parse_variant("SMTI") == Variant::kPartialTies);
    BOOST_CHECK(parse_variant("RankedTies") == Variant::kRankedTies);
    BOOST_CHECK(parse_variant("optimize") == Variant::kWeightedOptimize);
    BOOST_CHECK(parse_variant(variant_tag(Variant::kWeightedOptimize)) == Variant::kWeightedOptimize);
    BOOST_CHECK_THROW(parse_variant("hospitals"), InvalidInputError);
    BOOST_CHECK(parse_engine("DA") == Engine::kDeferredAcceptance);
}

BOOST_AUTO_TEST_SUITE_END()
