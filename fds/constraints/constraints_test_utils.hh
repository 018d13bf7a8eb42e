#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINTS_CONSTRAINTS_TEST_UTILS_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINTS_CONSTRAINTS_TEST_UTILS_HH

#include <fds/exception.hh>
#include <fds/problem.hh>
#include <fds/search_heuristics.hh>
#include <fds/solve.hh>

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <functional>
#include <iostream>
#include <random>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fds::test_innards
{
    template <typename ResultsSet_, typename IsSatisfying_, typename... Accumulated_>
    auto generate_expected(ResultsSet_ & expected, IsSatisfying_ is_satisfying, const std::tuple<Accumulated_...> & acc) -> void
    {
        if (std::apply(is_satisfying, acc))
            std::apply([&](auto &... args) { expected.emplace(args...); }, acc);
    }

    template <typename ResultsSet_, typename IsSatisfying_, typename... Accumulated_, typename... RestOfArgs_>
    auto generate_expected(ResultsSet_ & expected, IsSatisfying_ is_satisfying, const std::tuple<Accumulated_...> & acc,
        std::variant<int, std::pair<int, int>> range_arg, RestOfArgs_... rest_of_args) -> void
    {
        auto [lower, upper] = std::visit([](auto r) {
            if constexpr (std::is_same_v<decltype(r), int>)
                return std::pair{r, r};
            else
                return r;
        },
            range_arg);

        for (int n = lower; n <= upper; ++n)
            generate_expected(expected, is_satisfying, std::tuple_cat(acc, std::tuple{n}), rest_of_args...);
    }

    /**
     * Fill expected with every tuple from the cross product of the ranges
     * that is_satisfying accepts.
     */
    template <typename ResultsSet_, typename IsSatisfying_, typename... Args_>
    auto build_expected(ResultsSet_ & expected, IsSatisfying_ is_satisfying, Args_... args) -> void
    {
        generate_expected(expected, is_satisfying, std::tuple{}, args...);
    }

    template <typename ResultsSet_>
    auto check_results(const ResultsSet_ & expected, const ResultsSet_ & actual) -> void
    {
        using fmt::print;
        using std::cerr;

        if (expected != actual) {
            print(cerr, "test did not produce expected results\n");
            print(cerr, "expected: {}\n", expected);
            print(cerr, "actual:   {}\n", actual);
            for (auto & item : actual)
                if (! expected.contains(item))
                    print(cerr, "extra:    {}\n", item);
            for (auto & item : expected)
                if (! actual.contains(item))
                    print(cerr, "missing:  {}\n", item);

            throw UnexpectedException{"Test did not produce expected results"};
        }
    }

    inline auto create_integer_variable_or_constant(Problem & p, int v) -> IntegerVariableID
    {
        return p.create_integer_variable(Integer{v}, Integer{v});
    }

    inline auto create_integer_variable_or_constant(Problem & p, std::pair<int, int> v) -> IntegerVariableID
    {
        return p.create_integer_variable(Integer{v.first}, Integer{v.second});
    }

    /**
     * Solve, once with the default branching and once branching on the
     * smallest domain with the largest value first, collecting the values of
     * vars from every solution. Every solution must be new, and the two
     * searches must agree.
     */
    template <typename ResultsSet_, typename... Args_>
    auto solve_for_tests(Problem & p, ResultsSet_ & actual, const std::tuple<Args_...> & vars) -> void
    {
        auto collect = [&](const BranchCallback & branch) {
            ResultsSet_ result;
            solve_with(p, SolveCallbacks{
                              .solution = [&](const Solution & s) -> bool {
                                  bool fresh = std::apply([&](const auto &... args) {
                                      return result.emplace(static_cast<int>(s(args).raw_value)...).second;
                                  },
                                      vars);
                                  if (! fresh)
                                      throw UnexpectedException{"solution found twice"};
                                  return true;
                              },
                              .branch = branch});
            return result;
        };

        actual = collect(BranchCallback{});
        auto other = collect(branch_with(variable_order::dom(p), value_order::largest_first()));
        if (other != actual)
            throw UnexpectedException{"branching heuristics disagree on the solutions"};
    }

    struct RandomBounds
    {
        int lower_min, lower_max, add_min, add_max;
    };

    inline auto random_bounds(int lower_min, int lower_max, int add_min, int add_max) -> RandomBounds
    {
        return RandomBounds{lower_min, lower_max, add_min, add_max};
    }

    struct RandomConstant
    {
        int min, max;
    };

    inline auto random_constant(int min, int max) -> RandomConstant
    {
        return RandomConstant{min, max};
    }

    template <typename Random_>
    auto generate_random_data_item(Random_ & rand, const RandomBounds & bounds) -> std::variant<int, std::pair<int, int>>
    {
        std::uniform_int_distribution<int> lower_dist{bounds.lower_min, bounds.lower_max}, add_dist{bounds.add_min, bounds.add_max};
        auto lower = lower_dist(rand);
        auto upper = lower + add_dist(rand);
        return std::pair{lower, upper};
    }

    template <typename Random_>
    auto generate_random_data_item(Random_ & rand, const RandomConstant & constant) -> std::variant<int, std::pair<int, int>>
    {
        std::uniform_int_distribution<int> dist{constant.min, constant.max};
        return dist(rand);
    }

    template <typename Random_, typename Int_>
    auto generate_random_data_item(Random_ & rand, std::uniform_int_distribution<Int_> dist) -> Int_
    {
        return dist(rand);
    }

    template <typename Random_, typename Data_, typename... Args_>
    auto generate_random_data(Random_ & rand, Data_ & data, Args_... args) -> void
    {
        data.emplace_back(generate_random_data_item(rand, args)...);
    }
}

#endif
