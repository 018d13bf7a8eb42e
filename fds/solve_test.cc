#include <fds/constraints/all_different.hh>
#include <fds/constraints/not_equals.hh>
#include <fds/exception.hh>
#include <fds/innards/state.hh>
#include <fds/problem.hh>
#include <fds/search_heuristics.hh>
#include <fds/solve.hh>

#include <catch2/catch.hpp>

#include <fmt/core.h>

#include <atomic>
#include <climits>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace fds;

using std::atomic;
using std::chrono::microseconds;
using std::get;
using std::pair;
using std::rethrow_if_nested;
using std::runtime_error;
using std::size_t;
using std::string;
using std::vector;

namespace
{
    auto australia(Problem & p) -> vector<IntegerVariableID>
    {
        vector<string> names{"WA", "NT", "SA", "Q", "NSW", "V"};
        vector<IntegerVariableID> states;
        for (auto & n : names)
            states.push_back(p.create_integer_variable(0_i, 2_i, n));

        // each border is listed from both sides
        vector<pair<int, int>> neighbours{
            {0, 1}, {0, 2},
            {1, 0}, {1, 2}, {1, 3},
            {2, 0}, {2, 1}, {2, 3}, {2, 4}, {2, 5},
            {3, 1}, {3, 2}, {3, 4},
            {4, 3}, {4, 2}, {4, 5},
            {5, 2}, {5, 4}};
        for (auto & [a, b] : neighbours)
            p.post(NotEquals{states[a], states[b]});

        return states;
    }

    auto queens(Problem & p, int size) -> vector<IntegerVariableID>
    {
        auto result = p.create_integer_variable_vector(size, 0_i, Integer{size - 1}, "queen");
        vector<IntegerVariableID> plus, minus;
        for (int i = 0; i < size; ++i) {
            plus.push_back(result[i] + Integer{i});
            minus.push_back(result[i] - Integer{i});
        }
        p.post(AllDifferent{result});
        p.post(AllDifferent{plus});
        p.post(AllDifferent{minus});
        return result;
    }

    auto is_queens_solution(const vector<Integer> & rows) -> bool
    {
        for (size_t i = 0; i < rows.size(); ++i)
            for (size_t j = i + 1; j < rows.size(); ++j) {
                auto gap = Integer(j - i);
                if (rows[i] == rows[j] || rows[i] + gap == rows[j] || rows[i] - gap == rows[j])
                    return false;
            }
        return true;
    }

    auto all_solutions(Problem & p, const vector<IntegerVariableID> & vars, BranchCallback branch = BranchCallback{}) -> vector<vector<Integer>>
    {
        vector<vector<Integer>> result;
        auto stats = solve_with(p,
            SolveCallbacks{
                .solution = [&](const Solution & s) -> bool {
                    result.push_back(s(vars));
                    return true;
                },
                .branch = branch});
        CHECK(stats.completed);
        CHECK(stats.solutions == result.size());
        return result;
    }
}

TEST_CASE("Map colouring")
{
    Problem p;
    auto states = australia(p);
    CHECK(p.number_of_constraints() == 18u);

    // SA borders everything, leaving a two coloured path
    auto solutions = all_solutions(p, states);
    CHECK(solutions.size() == 6u);

    for (auto & s : solutions) {
        CHECK(s.at(0) != s.at(1));
        CHECK(s.at(0) != s.at(2));
        CHECK(s.at(1) != s.at(2));
        CHECK(s.at(1) != s.at(3));
        CHECK(s.at(2) != s.at(3));
        CHECK(s.at(2) != s.at(4));
        CHECK(s.at(2) != s.at(5));
        CHECK(s.at(3) != s.at(4));
        CHECK(s.at(4) != s.at(5));
    }

    CHECK(solutions.front() == vector{0_i, 1_i, 2_i, 0_i, 1_i, 0_i});
}

TEST_CASE("N queens")
{
    SECTION("4 queens")
    {
        Problem p;
        auto q = queens(p, 4);
        auto solutions = all_solutions(p, q);
        CHECK(solutions == vector<vector<Integer>>{{1_i, 3_i, 0_i, 2_i}, {2_i, 0_i, 3_i, 1_i}});
    }

    SECTION("8 queens")
    {
        Problem p;
        auto q = queens(p, 8);
        auto solutions = all_solutions(p, q);
        CHECK(solutions.size() == 92u);
        for (auto & s : solutions)
            CHECK(is_queens_solution(s));
    }

    SECTION("1 queen")
    {
        Problem p;
        auto q = queens(p, 1);
        CHECK(all_solutions(p, q).size() == 1u);
    }

    SECTION("3 queens")
    {
        Problem p;
        auto q = queens(p, 3);
        CHECK(all_solutions(p, q).empty());
    }
}

TEST_CASE("Solving is deterministic")
{
    Problem p;
    auto q = queens(p, 6);
    auto first = all_solutions(p, q);
    auto second = all_solutions(p, q);
    CHECK(first.size() == 4u);
    CHECK(first == second);

    Problem other;
    auto other_q = queens(other, 6);
    CHECK(all_solutions(other, other_q) == first);
}

TEST_CASE("Branching heuristics find the same solutions")
{
    Problem p;
    auto q = queens(p, 8);

    SECTION("largest first")
    {
        auto solutions = all_solutions(p, q, branch_with(variable_order::in_order(q), value_order::largest_first()));
        CHECK(solutions.size() == 92u);
        CHECK(solutions.front() == vector{7_i, 3_i, 0_i, 2_i, 5_i, 1_i, 6_i, 4_i});
    }

    SECTION("dom")
    {
        CHECK(all_solutions(p, q, branch_with(variable_order::dom(p), value_order::smallest_first())).size() == 92u);
    }

    SECTION("dom then deg")
    {
        CHECK(all_solutions(p, q, branch_with(variable_order::dom_then_deg(q), value_order::smallest_first())).size() == 92u);
    }

    SECTION("partial branching")
    {
        auto first_half = vector<IntegerVariableID>(q.begin(), q.begin() + 4);
        CHECK(all_solutions(p, q, branch_with(variable_order::in_order(first_half), value_order::largest_first())).size() == 92u);
    }
}

TEST_CASE("Trivial problems")
{
    SECTION("one variable, no constraints")
    {
        Problem p;
        auto x = p.create_integer_variable(-2_i, 3_i, "x");
        CHECK(all_solutions(p, {x}) == vector<vector<Integer>>{{-2_i}, {-1_i}, {0_i}, {1_i}, {2_i}, {3_i}});
    }

    SECTION("one variable from a set of values")
    {
        Problem p;
        auto x = p.create_integer_variable(vector{10_i, 3_i, 7_i});
        CHECK(all_solutions(p, {x}) == vector<vector<Integer>>{{3_i}, {7_i}, {10_i}});
    }

    SECTION("no variables")
    {
        Problem p;
        auto stats = solve(p, [&](const Solution & s) -> bool {
            CHECK(s.values().empty());
            return true;
        });
        CHECK(stats.solutions == 1u);
        CHECK(stats.branches == 0u);
        CHECK(stats.completed);
    }

    SECTION("contradiction before search")
    {
        Problem p;
        auto x = p.create_integer_variable(1_i, 3_i);
        p.post(NotEquals{x + 1_i, x + 1_i});
        auto stats = solve(p, [&](const Solution &) -> bool {
            FAIL("should not find a solution");
            return true;
        });
        CHECK(stats.solutions == 0u);
        CHECK(stats.completed);
    }

    SECTION("fixed variables")
    {
        Problem p;
        auto x = p.create_integer_variable(2_i, 2_i);
        auto y = p.create_integer_variable(1_i, 3_i);
        p.post(NotEquals{x, y});
        CHECK(all_solutions(p, {x, y}) == vector<vector<Integer>>{{2_i, 1_i}, {2_i, 3_i}});
    }
}

TEST_CASE("Invalid domains")
{
    Problem p;
    CHECK_THROWS_AS(p.create_integer_variable(5_i, 2_i), InvalidDomain);
    CHECK_THROWS_AS(p.create_integer_variable(vector<Integer>{}), InvalidDomain);
    CHECK_THROWS_AS(p.create_integer_variable(0_i, Integer{4'000'000'000'000LL}), InvalidDomain);
    CHECK_THROWS_AS(p.create_integer_variable(Integer{LLONG_MIN}, Integer{LLONG_MAX}, "x"), InvalidDomain);
    CHECK_THROWS_AS(p.create_integer_variable(vector{0_i, Integer{LLONG_MAX}}), InvalidDomain);
    CHECK_THROWS_AS(p.create_integer_variable_vector(2, Integer{LLONG_MIN}, Integer{LLONG_MAX}), InvalidDomain);
    CHECK(p.all_normal_variables().empty());

    // nothing was kept from the rejected variable, including its name
    auto x = p.create_integer_variable(Integer{LLONG_MAX - 1}, Integer{LLONG_MAX}, "x");
    CHECK(all_solutions(p, {x}) == vector<vector<Integer>>{{Integer{LLONG_MAX - 1}}, {Integer{LLONG_MAX}}});
}

TEST_CASE("Naming")
{
    Problem p;
    auto x = p.create_integer_variable(1_i, 2_i, "x");
    auto y = p.create_integer_variable(1_i, 2_i);
    auto v = p.create_integer_variable_vector(2, 1_i, 2_i, "v");

    CHECK(p.name_of(x) == "x");
    CHECK(p.name_of(y) == "1");
    CHECK(p.name_of(get<SimpleIntegerVariableID>(v.at(1))) == "v[1]");

    // names given by the caller are carried into diagnostics
    auto state = p.create_state_for_new_search();
    CHECK(state.describe(x + 1_i) == "x + 1");
    CHECK(state.describe(v.at(1)) == "v[1]");
    CHECK(state.describe(y) == "varidx 1");

    CHECK_THROWS_AS(p.create_integer_variable(1_i, 2_i, "x"), NamingError);
    CHECK_THROWS_AS(p.create_integer_variable(1_i, 2_i, "3x"), NamingError);
}

TEST_CASE("Solutions")
{
    Problem p;
    auto x = p.create_integer_variable(1_i, 3_i);
    auto y = p.create_integer_variable(1_i, 3_i);
    p.post(NotEquals{x, y});

    vector<Solution> kept;
    auto stats = solve(p, [&](const Solution & s) -> bool {
        kept.push_back(s);
        return true;
    });

    REQUIRE(kept.size() == 6u);
    CHECK(stats.solutions == 6u);
    for (size_t i = 0; i < kept.size(); ++i) {
        CHECK(kept[i].index() == i);
        CHECK(kept[i](x) != kept[i](y));
        CHECK(kept[i](x + 10_i) == kept[i](x) + 10_i);
        if (i > 0)
            CHECK(kept[i].time_since_start() >= kept[i - 1].time_since_start());
        CHECK(kept[i].time_since_start() <= stats.solve_time);
    }

    CHECK(kept[0](vector<IntegerVariableID>{x, y}) == vector{1_i, 2_i});
    CHECK_THROWS_AS(kept[0](SimpleIntegerVariableID{2}), VariableDoesNotHaveValue);
}

TEST_CASE("Stopping early")
{
    Problem p;
    auto q = queens(p, 8);

    SECTION("solution callback returns false")
    {
        auto stats = solve(p, [&](const Solution &) -> bool { return false; });
        CHECK(stats.solutions == 1u);
        CHECK(! stats.completed);
    }

    SECTION("abort flag set from the callback")
    {
        atomic<bool> abort_flag{false};
        unsigned long long seen = 0;
        auto stats = solve_with(
            p, SolveCallbacks{.solution = [&](const Solution &) -> bool {
                if (++seen == 3)
                    abort_flag = true;
                return true;
            }},
            &abort_flag);
        CHECK(seen == 3u);
        CHECK(stats.solutions == 3u);
        CHECK(! stats.completed);
    }

    SECTION("abort flag set before solving")
    {
        atomic<bool> abort_flag{true};
        bool completed_called = false;
        auto stats = solve_with(
            p, SolveCallbacks{.completed = [&]() { completed_called = true; }}, &abort_flag);
        CHECK(stats.solutions == 0u);
        CHECK(! stats.completed);
        CHECK(! completed_called);
    }

    SECTION("trace callback returns false")
    {
        unsigned long long nodes = 0;
        auto stats = solve_with(p, SolveCallbacks{.trace = [&](unsigned long long depth, const Stats &) -> bool {
            CHECK(depth <= 8u);
            return ++nodes < 5;
        }});
        CHECK(nodes == 5u);
        CHECK(! stats.completed);
    }

    SECTION("completed callback")
    {
        bool completed_called = false;
        unsigned long long nodes = 0;
        auto stats = solve_with(p, SolveCallbacks{
                                       .trace = [&](unsigned long long, const Stats &) -> bool {
                                           ++nodes;
                                           return true;
                                       },
                                       .completed = [&]() { completed_called = true; }});
        CHECK(completed_called);
        CHECK(stats.completed);
        CHECK(stats.solutions == 92u);
        CHECK(nodes > 0u);
        CHECK(stats.max_depth <= 8u);
        CHECK(stats.branches > stats.conflicts);
    }

    // after stopping early, the problem can be solved again from scratch
    CHECK(all_solutions(p, q).size() == 92u);
}

TEST_CASE("Callback failures")
{
    Problem p;
    auto q = queens(p, 6);

    SECTION("exception from the solution callback")
    {
        unsigned long long seen = 0;
        try {
            solve(p, [&](const Solution &) -> bool {
                if (++seen == 2)
                    throw runtime_error{"oops"};
                return true;
            });
            FAIL("expected a CallbackFailure");
        }
        catch (const CallbackFailure & e) {
            CHECK(string{e.what()}.find("oops") != string::npos);
            CHECK(! e.partial_stats().completed);
            CHECK(e.partial_stats().solutions == 2u);
            CHECK_THROWS_AS(rethrow_if_nested(e), runtime_error);
        }
    }

    SECTION("changing the problem from the callback is rejected")
    {
        auto variables_before = p.all_normal_variables().size();
        auto constraints_before = p.number_of_constraints();
        try {
            solve(p, [&](const Solution &) -> bool {
                (void)p.create_integer_variable(1_i, 2_i);
                return true;
            });
            FAIL("expected a CallbackFailure");
        }
        catch (const CallbackFailure & e) {
            CHECK(e.partial_stats().solutions == 1u);
            CHECK_THROWS_AS(rethrow_if_nested(e), UnexpectedException);
        }

        try {
            solve(p, [&](const Solution &) -> bool {
                p.post(NotEquals{q[0], q[1]});
                return true;
            });
            FAIL("expected a CallbackFailure");
        }
        catch (const CallbackFailure & e) {
            CHECK_THROWS_AS(rethrow_if_nested(e), UnexpectedException);
        }

        CHECK(p.all_normal_variables().size() == variables_before);
        CHECK(p.number_of_constraints() == constraints_before);
    }

    SECTION("nested solve is rejected")
    {
        try {
            solve(p, [&](const Solution &) -> bool {
                solve(p, [](const Solution &) -> bool { return true; });
                return true;
            });
            FAIL("expected a CallbackFailure");
        }
        catch (const CallbackFailure & e) {
            CHECK(e.partial_stats().solutions == 1u);
            CHECK_THROWS_AS(rethrow_if_nested(e), UnexpectedException);
        }
    }

    CHECK(all_solutions(p, q).size() == 4u);
}

TEST_CASE("Statistics")
{
    Problem p;
    queens(p, 5);
    auto stats = solve(p, [](const Solution &) -> bool { return true; });

    CHECK(stats.solutions == 10u);
    CHECK(stats.n_propagators == 3u);
    CHECK(stats.propagations >= stats.effectful_propagations);
    CHECK(stats.solve_time >= microseconds{0});

    auto text = fmt::format("{}", stats);
    CHECK(text.find("solutions: 10\n") != string::npos);
    CHECK(text.find("propagators: 3\n") != string::npos);
    CHECK(text.find("did not complete") == string::npos);

    stats.completed = false;
    CHECK(fmt::format("{}", stats).find("search did not complete") != string::npos);
}
