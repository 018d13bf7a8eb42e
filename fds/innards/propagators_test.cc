#include <fds/constraints/all_different.hh>
#include <fds/constraints/not_equals.hh>
#include <fds/exception.hh>
#include <fds/innards/propagators.hh>
#include <fds/innards/state.hh>

#include <catch2/catch.hpp>

#include <vector>

using namespace fds;
using namespace fds::innards;

using std::vector;

namespace
{
    auto snapshot(const State & state, const vector<IntegerVariableID> & vars) -> vector<vector<Integer>>
    {
        vector<vector<Integer>> result;
        for (auto & v : vars)
            result.push_back(state.copy_of_values(v));
        return result;
    }
}

TEST_CASE("Propagation reaches a fixed point")
{
    State state;
    vector<IntegerVariableID> vars;
    for (int i = 0; i < 4; ++i)
        vars.push_back(state.allocate_integer_variable_with_state(1_i, 4_i));

    Propagators propagators;
    AllDifferent{vars}.install(propagators, state);
    CHECK(propagators.number_of_propagators() == 1u);

    CHECK(state.assign(vars[0], 1_i) == Inference::Instantiated);
    CHECK(state.assign(vars[1], 2_i) == Inference::Instantiated);
    REQUIRE(propagators.propagate(state));

    CHECK(state.copy_of_values(vars[2]) == vector{3_i, 4_i});
    CHECK(state.copy_of_values(vars[3]) == vector{3_i, 4_i});

    auto after_first = snapshot(state, vars);
    CHECK(propagate_value_all_different(vars, state) == PropagationResult::Unchanged);
    REQUIRE(propagators.propagate(state));
    CHECK(snapshot(state, vars) == after_first);
}

TEST_CASE("Propagation cascades through newly assigned variables")
{
    State state;
    auto a = state.allocate_integer_variable_with_state(1_i, 3_i);
    auto b = state.allocate_integer_variable_with_state(1_i, 2_i);
    auto c = state.allocate_integer_variable_with_state(2_i, 3_i);

    Propagators propagators;
    NotEquals{a, b}.install(propagators, state);
    NotEquals{b, c}.install(propagators, state);
    NotEquals{a, c}.install(propagators, state);

    CHECK(state.assign(b, 1_i) == Inference::Instantiated);
    REQUIRE(propagators.propagate(state));

    CHECK(state.copy_of_values(a) == vector{2_i, 3_i});
    CHECK(state.copy_of_values(c) == vector{2_i, 3_i});

    state.guess(a, 2_i);
    REQUIRE(propagators.propagate(state));
    CHECK(state.optional_single_value(c) == 3_i);
    CHECK(propagators.is_consistent(state));
}

TEST_CASE("Propagation detects contradiction")
{
    State state;
    auto x = state.allocate_integer_variable_with_state(1_i, 2_i);
    auto y = state.allocate_integer_variable_with_state(1_i, 2_i);
    auto z = state.allocate_integer_variable_with_state(1_i, 2_i);

    Propagators propagators;
    AllDifferent{vector<IntegerVariableID>{x, y, z}}.install(propagators, state);

    REQUIRE(propagators.propagate(state));

    auto timestamp = state.new_epoch();
    state.guess(x, 1_i);
    CHECK(! propagators.propagate(state));
    CHECK(propagators.name_of_last_contradiction() == "all different");

    state.backtrack(timestamp);
    CHECK(state.domain_size(x) == 2_i);
    CHECK(state.domain_size(y) == 2_i);
    CHECK(state.domain_size(z) == 2_i);
}

TEST_CASE("Backtracking restores domains after propagation")
{
    State state;
    vector<IntegerVariableID> vars;
    for (int i = 0; i < 5; ++i)
        vars.push_back(state.allocate_integer_variable_with_state(0_i, 4_i));

    vector<IntegerVariableID> diagonal;
    for (int i = 0; i < 5; ++i)
        diagonal.push_back(vars[i] + Integer{i});

    Propagators propagators;
    AllDifferent{vars}.install(propagators, state);
    AllDifferent{diagonal}.install(propagators, state);

    REQUIRE(propagators.propagate(state));
    auto at_root = snapshot(state, vars);
    auto root = state.new_epoch();

    state.guess(vars[0], 0_i);
    REQUIRE(propagators.propagate(state));
    auto at_depth_one = snapshot(state, vars);
    CHECK(at_depth_one != at_root);
    auto depth_one = state.new_epoch();

    state.guess(vars[1], 2_i);
    REQUIRE(propagators.propagate(state));
    CHECK(snapshot(state, vars) != at_depth_one);

    state.backtrack(depth_one);
    CHECK(snapshot(state, vars) == at_depth_one);

    state.backtrack(root);
    CHECK(snapshot(state, vars) == at_root);
}

TEST_CASE("Views of the same variable")
{
    State state;
    auto x = state.allocate_integer_variable_with_state(1_i, 5_i);

    SECTION("different offsets never conflict")
    {
        Propagators propagators;
        NotEquals{x, x + 1_i}.install(propagators, state);
        CHECK(propagators.number_of_propagators() == 0u);
        CHECK(propagators.propagate(state));
    }

    SECTION("equal offsets always conflict")
    {
        Propagators propagators;
        NotEquals{x + 2_i, x + 2_i}.install(propagators, state);
        CHECK(! propagators.propagate(state));
        CHECK(propagators.name_of_last_contradiction().starts_with("model contradiction"));
    }

    SECTION("named variables appear in the explanation")
    {
        state.name_variable(x, "x");
        Propagators propagators;
        NotEquals{x - 2_i, x - 2_i}.install(propagators, state);
        CHECK(! propagators.propagate(state));
        CHECK(propagators.name_of_last_contradiction() == "model contradiction: NotEquals on x - 2 and itself");
    }

    SECTION("all different with a repeated member")
    {
        Propagators propagators;
        AllDifferent{vector<IntegerVariableID>{x, x}}.install(propagators, state);
        REQUIRE(propagators.propagate(state));
        state.guess(x, 3_i);
        CHECK(! propagators.propagate(state));
    }
}

TEST_CASE("Degree and statistics")
{
    State state;
    auto x = state.allocate_integer_variable_with_state(1_i, 3_i);
    auto y = state.allocate_integer_variable_with_state(1_i, 3_i);
    auto z = state.allocate_integer_variable_with_state(1_i, 3_i);

    Propagators propagators;
    NotEquals{x, y}.install(propagators, state);
    NotEquals{x, z + 1_i}.install(propagators, state);

    CHECK(propagators.degree_of(x) == 2);
    CHECK(propagators.degree_of(y) == 1);
    CHECK(propagators.degree_of(z - 1_i) == 1);

    REQUIRE(propagators.propagate(state));

    Stats stats;
    propagators.fill_in_constraint_stats(stats);
    CHECK(stats.n_propagators == 2u);
    CHECK(stats.propagations == 2u);
    CHECK(stats.effectful_propagations == 0u);
}

TEST_CASE("Missing variables are rejected")
{
    State state;
    auto x = state.allocate_integer_variable_with_state(1_i, 3_i);

    Propagators propagators;
    CHECK_THROWS_AS((NotEquals{x, SimpleIntegerVariableID{7}}.install(propagators, state)), UnexpectedException);
    CHECK_THROWS_AS((AllDifferent{vector<IntegerVariableID>{x, SimpleIntegerVariableID{3}}}.install(propagators, state)), UnexpectedException);
}
