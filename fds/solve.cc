#include <fds/exception.hh>
#include <fds/innards/propagators.hh>
#include <fds/innards/search.hh>
#include <fds/innards/state.hh>
#include <fds/search_heuristics.hh>
#include <fds/solve.hh>

#include <exception>
#include <utility>
#include <vector>

using namespace fds;
using namespace fds::innards;

using std::atomic;
using std::exception;
using std::move;
using std::throw_with_nested;
using std::vector;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::steady_clock;

namespace
{
    struct SolvingGuard
    {
        Problem & problem;

        explicit SolvingGuard(Problem & p) :
            problem(p)
        {
            problem.begin_solving();
        }

        ~SolvingGuard()
        {
            problem.end_solving();
        }

        SolvingGuard(const SolvingGuard &) = delete;
        auto operator=(const SolvingGuard &) -> SolvingGuard & = delete;
    };

    auto default_branch(const Problem & problem) -> BranchCallback
    {
        return branch_with(variable_order::in_order(problem), value_order::smallest_first());
    }
}

auto fds::solve_with(Problem & problem, SolveCallbacks callbacks, atomic<bool> * optional_abort_flag) -> Stats
{
    SolvingGuard guard{problem};

    Stats stats;
    auto start_time = steady_clock::now();

    auto finish_stats = [&](const Propagators & propagators) {
        stats.solve_time = duration_cast<microseconds>(steady_clock::now() - start_time);
        propagators.fill_in_constraint_stats(stats);
    };

    auto state = problem.create_state_for_new_search();
    auto propagators = problem.create_propagators(state);

    // whatever a user supplied branch callback leaves alone still has to be
    // given a value before we can call it a solution
    auto branch = callbacks.branch
        ? branch_sequence(move(callbacks.branch), default_branch(problem))
        : default_branch(problem);

    Search search{state, propagators, move(branch), callbacks.trace, stats, optional_abort_flag};

    bool keep_going = true;
    while (keep_going) {
        switch (search.next()) {
        case SearchStatus::SolutionFound: {
            if (! callbacks.solution)
                break;

            vector<Integer> values;
            values.reserve(problem.all_normal_variables().size());
            for (auto & v : problem.all_normal_variables())
                values.push_back(state(v));

            Solution solution{move(values), stats.solutions - 1,
                duration_cast<microseconds>(steady_clock::now() - start_time)};

            try {
                if (! callbacks.solution(solution)) {
                    search.abandon();
                    keep_going = false;
                }
            }
            catch (const exception & e) {
                search.abandon();
                finish_stats(propagators);
                throw_with_nested(CallbackFailure{e.what(), stats});
            }
            catch (...) {
                search.abandon();
                finish_stats(propagators);
                throw_with_nested(CallbackFailure{"unknown exception", stats});
            }
        } break;

        case SearchStatus::Exhausted:
            stats.completed = true;
            if (callbacks.completed)
                callbacks.completed();
            keep_going = false;
            break;

        case SearchStatus::Aborted:
            keep_going = false;
            break;

        case SearchStatus::Exploring:
            throw UnexpectedException{"search returned without finishing a step"};
        }
    }

    finish_stats(propagators);
    return stats;
}

auto fds::solve(Problem & problem, SolutionCallback callback) -> Stats
{
    return solve_with(problem, SolveCallbacks{.solution = move(callback)});
}
