#include <boost/test/unit_test.hpp>

#include <stdexcept>

#include "examples.h"
#include "formulator.h"
#include "test_helpers.h"

using namespace blm;
using namespace blm_test;

namespace {

struct Models {
    Models(const MatchingProblem& p, Variant v)
        : pm(p.proposers, p.receivers, p.proposer_prefs, requires_complete_lists(v)),
          rm(p.receivers, p.proposers, p.receiver_prefs, requires_complete_lists(v)) {}
    PreferenceModel pm;
    PreferenceModel rm;
};

std::size_t count_sense(const ConstraintModel& m, Sense s) {
    std::size_t n = 0;
    for (const auto& c : m.cardinalities())
        if (c.sense == s) ++n;
    return n;
}

} // namespace

BOOST_AUTO_TEST_SUITE(constraint_formulator)

BOOST_AUTO_TEST_CASE(total_order_model_shape)
{
    const MatchingProblem p = example_problem(Variant::kTotalOrder);
    const Models m(p, Variant::kTotalOrder);
    const Formulation f = formulate(Variant::kTotalOrder, p, m.pm, m.rm, SolveOptions{});

    // 9 pair variables plus one strict auxiliary per (owner, rank)
    BOOST_TEST(f.pair_vars.size() == 9u);
    BOOST_TEST(f.model.num_vars() == 27);
    BOOST_TEST(f.model.equivalences().size() == 18u);
    BOOST_TEST(f.model.clauses().size() == 9u);
    BOOST_TEST(f.model.cardinalities().size() == 6u);
    BOOST_TEST(count_sense(f.model, Sense::kEqual) == 6u);
    BOOST_TEST(!f.model.has_objective());
    BOOST_TEST(f.model.name(f.pair_vars.at(MatchPair{"Ishaan", "Kevin"})) == "x_Ishaan_Kevin");

    // nothing is strictly better than a first choice
    std::size_t empty_targets = 0;
    for (const auto& e : f.model.equivalences())
        if (e.vars.empty()) ++empty_targets;
    BOOST_TEST(empty_targets == 6u);
}

BOOST_AUTO_TEST_CASE(tied_candidates_share_an_auxiliary)
{
    const MatchingProblem p = example_problem(Variant::kRankedTies);
    const Models m(p, Variant::kRankedTies);
    const Formulation f = formulate(Variant::kRankedTies, p, m.pm, m.rm, SolveOptions{});

    // Ishaan and Kevin each have a tie, so two auxiliaries fewer per side
    BOOST_TEST(f.model.num_vars() == 9 + 8 + 8);
    BOOST_TEST(f.model.clauses().size() == 9u);

    // weak comparison: the rank-1 auxiliary of Ishaan covers both Swapneel and Zora
    bool found = false;
    for (const auto& e : f.model.equivalences()) {
        if (f.model.name(e.target) == "p_Ishaan_geq_1") {
            found = true;
            BOOST_TEST(e.vars.size() == 2u);
        }
    }
    BOOST_TEST(found);
}

BOOST_AUTO_TEST_CASE(partial_lists_only_get_acceptable_pairs)
{
    const MatchingProblem p = example_problem(Variant::kPartialTies);
    const Models m(p, Variant::kPartialTies);
    const Formulation f = formulate(Variant::kPartialTies, p, m.pm, m.rm, SolveOptions{});

    BOOST_TEST(f.pair_vars.size() == 5u);
    BOOST_TEST(f.pair_vars.count(MatchPair{"Ishaan", "Kevin"}) == 0u);
    BOOST_TEST(f.pair_vars.count(MatchPair{"Cindy", "Swapneel"}) == 0u);
    BOOST_TEST(f.model.num_vars() == 5 + 4 + 5);
    BOOST_TEST(count_sense(f.model, Sense::kLessOrEqual) == 6u);
    BOOST_TEST(count_sense(f.model, Sense::kEqual) == 0u);
    BOOST_TEST(f.model.clauses().size() == 5u);
}

BOOST_AUTO_TEST_CASE(forced_pairs_are_fixed_and_skip_their_clause)
{
    const MatchingProblem p = example_problem(Variant::kTotalOrder);
    const Models m(p, Variant::kTotalOrder);
    SolveOptions o;
    o.forced_pairs = {{"Ishaan", "Kevin"}};
    const Formulation f = formulate(Variant::kTotalOrder, p, m.pm, m.rm, o);

    BOOST_REQUIRE(f.model.fixings().size() == 1u);
    BOOST_TEST(f.model.fixings()[0].var == f.pair_vars.at(MatchPair{"Ishaan", "Kevin"}));
    BOOST_TEST(!f.model.fixings()[0].negated);
    BOOST_TEST(f.model.clauses().size() == 8u);
}

BOOST_AUTO_TEST_CASE(weighted_model_shape)
{
    const MatchingProblem p = example_problem(Variant::kWeightedOptimize);
    const Models m(p, Variant::kWeightedOptimize);
    SolveOptions o;
    const Formulation f = formulate(Variant::kWeightedOptimize, p, m.pm, m.rm, o);

    BOOST_TEST(f.model.num_vars() == 12);
    BOOST_TEST(f.model.clauses().empty());
    BOOST_TEST(f.model.equivalences().empty());
    BOOST_TEST(f.model.has_objective());
    BOOST_TEST(f.model.objective().size() == 12u);
    BOOST_TEST(f.scores.size() == 12u);
    // at least one and at most capacity, on both sides
    BOOST_TEST(count_sense(f.model, Sense::kGreaterOrEqual) == 7u);
    BOOST_TEST(count_sense(f.model, Sense::kLessOrEqual) == 7u);

    bool cindy_cap = false;
    for (const auto& c : f.model.cardinalities())
        if (c.sense == Sense::kLessOrEqual && c.rhs == 2) cindy_cap = true;
    BOOST_TEST(cindy_cap);

    o.enforce_exactly_one = true;
    const Formulation g = formulate(Variant::kWeightedOptimize, p, m.pm, m.rm, o);
    BOOST_TEST(g.model.cardinalities().size() == 7u);
    BOOST_TEST(count_sense(g.model, Sense::kEqual) == 7u);
}

BOOST_AUTO_TEST_CASE(extract_reads_pair_variables_only)
{
    const MatchingProblem p = example_problem(Variant::kPartialTies);
    const Models m(p, Variant::kPartialTies);
    const Formulation f = formulate(Variant::kPartialTies, p, m.pm, m.rm, SolveOptions{});

    std::vector<bool> values(f.model.num_vars(), true);
    values[f.pair_vars.at(MatchPair{"Ishaan", "Zora"})] = false;
    const Matching got = extract_matching(f, values);
    BOOST_TEST(got.size() == 4u);
    BOOST_TEST(!got.contains("Ishaan", "Zora"));

    BOOST_CHECK_THROW(extract_matching(f, std::vector<bool>(3, false)), std::logic_error);
}

BOOST_AUTO_TEST_CASE(model_rejects_bad_variables)
{
    ConstraintModel cm;
    const int a = cm.new_bool("a");
    BOOST_CHECK_THROW(cm.add_cardinality({a, 7}, Sense::kEqual, 1), std::logic_error);
    BOOST_CHECK_THROW(cm.add_clause({}), std::logic_error);
    BOOST_CHECK_THROW(cm.add_or_equivalence(a, {a}), std::logic_error);
    BOOST_CHECK_THROW(cm.fix(-1, true), std::logic_error);
}

BOOST_AUTO_TEST_SUITE_END()
