#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_SEARCH_HEURISTICS_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_SEARCH_HEURISTICS_HH

#include <fds/problem.hh>
#include <fds/solve.hh>

#include <functional>
#include <optional>
#include <vector>

namespace fds
{
    /**
     * \defgroup SearchHeuristics Common search heuristics for fds::solve_with
     *
     * Every heuristic here is deterministic, so solving the same Problem
     * twice gives the same solutions in the same order.
     *
     * \sa SolveCallbacks
     */

    /**
     * Specifies how to decide which variable to branch on, for SolveCallbacks. Usually this will be used
     * via the fds::branch_with() function, which takes a BranchVariableSelector from the fds::variable_order::
     * namespace and a BranchValueGenerator from the fds::value_order:: namespace. Returning nullopt means
     * all relevant variables are already assigned.
     *
     * \ingroup SearchHeuristics
     */
    using BranchVariableSelector = std::function<auto(const innards::State &, const innards::Propagators &)
                                                     ->std::optional<IntegerVariableID>>;

    /**
     * Given a branch variable, which values do we try, and in what order?
     *
     * \ingroup SearchHeuristics
     */
    using BranchValueGenerator = std::function<auto(const innards::State &, const IntegerVariableID &)->std::vector<Integer>>;

    /**
     * Combine a BranchVariableSelector from fds::variable_order:: with a BranchValueGenerator
     * from fds::value_order:: to produce a BranchCallback for SolveCallbacks.
     *
     * \ingroup SearchHeuristics
     */
    [[nodiscard]] auto branch_with(BranchVariableSelector, BranchValueGenerator) -> BranchCallback;

    /**
     * Combine two BranchCallback instances, first trying the first instance, and if it returns
     * nullopt, instead trying the second instance.
     *
     * \ingroup SearchHeuristics
     */
    [[nodiscard]] auto branch_sequence(BranchCallback, BranchCallback) -> BranchCallback;

    /**
     * Variable ordering heuristics.
     *
     * \ingroup SearchHeuristics
     */
    namespace variable_order
    {
        /**
         * Used by fds::variable_order::in_order_of() to implement a variable ordering heuristic
         * that picks the smallest variable wrt this comparator. Ties go to whichever comes first.
         *
         * \ingroup SearchHeuristics
         */
        using VariableComparator = std::function<auto(const innards::State &, const innards::Propagators &,
            const IntegerVariableID &, const IntegerVariableID &)
                                                     ->bool>;

        [[nodiscard]] auto in_order_of(std::vector<IntegerVariableID>, VariableComparator) -> BranchVariableSelector;

        /**
         * Branch on the first non-assigned variable, in the order given.
         *
         * \ingroup SearchHeuristics
         * \sa fds::branch_with()
         */
        [[nodiscard]] auto in_order(std::vector<IntegerVariableID>) -> BranchVariableSelector;

        /**
         * Branch on the first non-assigned variable, in the order they were created.
         *
         * \ingroup SearchHeuristics
         * \sa fds::branch_with()
         */
        [[nodiscard]] auto in_order(const Problem &) -> BranchVariableSelector;

        /**
         * Branch on the non-assigned variable with smallest domain.
         *
         * \ingroup SearchHeuristics
         * \sa fds::branch_with()
         */
        [[nodiscard]] auto dom(std::vector<IntegerVariableID>) -> BranchVariableSelector;

        [[nodiscard]] auto dom(const Problem &) -> BranchVariableSelector;

        /**
         * Branch on the non-assigned variable with smallest domain, tie-breaking on highest
         * constraint degree.
         *
         * \ingroup SearchHeuristics
         * \sa fds::branch_with()
         */
        [[nodiscard]] auto dom_then_deg(std::vector<IntegerVariableID>) -> BranchVariableSelector;

        [[nodiscard]] auto dom_then_deg(const Problem &) -> BranchVariableSelector;
    }

    /**
     * Value ordering heuristics.
     *
     * \ingroup SearchHeuristics
     */
    namespace value_order
    {
        /**
         * Iterate from smallest value to largest.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto smallest_first() -> BranchValueGenerator;

        /**
         * Iterate from largest value to smallest.
         *
         * \ingroup SearchHeuristics
         */
        [[nodiscard]] auto largest_first() -> BranchValueGenerator;
    }
}

#endif
