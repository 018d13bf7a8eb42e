#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_SOLVE_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_SOLVE_HH

#include <fds/innards/propagators-fwd.hh>
#include <fds/innards/state-fwd.hh>
#include <fds/problem.hh>
#include <fds/solution.hh>
#include <fds/stats.hh>

#include <atomic>
#include <functional>
#include <optional>
#include <vector>

namespace fds
{
    /**
     * \defgroup SolveCallbacks Callbacks for solving
     *
     * \sa SearchHeuristics
     */

    /**
     * \brief Called for every solution found when using fds::solve() and
     * fds::solve_with(), in the order they are found. If false is returned
     * then no further solutions will be given. If it throws, solving stops
     * and CallbackFailure is thrown.
     *
     * \ingroup SolveCallbacks
     */
    using SolutionCallback = std::function<auto(const Solution &)->bool>;

    /**
     * \brief Called by fds::solve_with() at every search node after
     * propagation, before branching, with the current depth and the
     * statistics so far. If false is returned then search will stop.
     *
     * \ingroup SolveCallbacks
     */
    using TraceCallback = std::function<auto(unsigned long long depth, const Stats &)->bool>;

    /**
     * \brief A branching choice: a variable, and the values to try for it,
     * in order.
     *
     * \ingroup SolveCallbacks
     */
    struct Branch
    {
        IntegerVariableID variable;
        std::vector<Integer> values;
    };

    /**
     * \brief Called by fds::solve_with() to determine branching when
     * searching. Should return nullopt if every variable it cares about is
     * assigned. Any variables it leaves unassigned are then branched on in
     * the order they were created, smallest value first.
     *
     * \ingroup SolveCallbacks
     * \sa SearchHeuristics
     */
    using BranchCallback = std::function<auto(const innards::State &, const innards::Propagators &)->std::optional<Branch>>;

    /**
     * \brief Called by fds::solve_with() after the solve has completed
     * successfully (not aborted due to a callback returning false, or the
     * abort flag being set).
     *
     * \ingroup SolveCallbacks
     */
    using CompletedCallback = std::function<auto()->void>;

    /**
     * \brief Callbacks for fds::solve_with().
     *
     * Every callback is optional.
     *
     * \ingroup SolveCallbacks
     */
    struct SolveCallbacks final
    {
        SolutionCallback solution = SolutionCallback{};
        TraceCallback trace = TraceCallback{};
        BranchCallback branch = BranchCallback{};
        CompletedCallback completed = CompletedCallback{};
    };

    /**
     * \brief Solve a problem, and call the provided callback for each solution
     * found.
     *
     * If the callback returns false, no further solutions will be provided,
     * and the returned Stats are marked as not completed.
     *
     * \ingroup Core
     * \sa SolveCallbacks
     */
    auto solve(Problem &, SolutionCallback callback) -> Stats;

    /**
     * \brief Solve a problem, with callbacks for various events.
     *
     * All callback members are optional. If a solution or trace callback
     * returns false, no further solutions will be provided.
     *
     * If the final argument is not nullptr, the provided atomic will be
     * polled and search will abort if it becomes true.
     *
     * \ingroup Core
     * \sa SolveCallbacks
     */
    auto solve_with(Problem &, SolveCallbacks callbacks, std::atomic<bool> * optional_abort_flag = nullptr) -> Stats;
}

#endif
