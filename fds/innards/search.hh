#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_SEARCH_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_SEARCH_HH

#include <fds/innards/propagators-fwd.hh>
#include <fds/innards/state-fwd.hh>
#include <fds/solve.hh>
#include <fds/stats.hh>

#include <atomic>
#include <memory>

namespace fds::innards
{
    /**
     * \brief Where a Search has got to.
     *
     * \sa Search::next()
     * \ingroup Innards
     */
    enum class SearchStatus
    {
        Exploring,
        SolutionFound,
        Exhausted,
        Aborted
    };

    /**
     * \brief Depth first backtracking search, one solution at a time.
     *
     * Each call to next() carries on from wherever the previous call stopped,
     * and runs until either every variable is assigned with no constraint
     * violated (SolutionFound, and the State then holds that assignment), or
     * there is nothing left to try (Exhausted). If the abort flag is set or
     * the trace callback returns false, it gives Aborted instead, and stops.
     *
     * Every decision is a frame holding the branch variable, the values
     * left to try for it, and a Timestamp to backtrack to before trying the
     * next one. Branching and conflict counts go into the supplied Stats.
     *
     * The State and Propagators must outlive the Search. Destroying a
     * Search backtracks the State to where it was before search started.
     *
     * \ingroup Innards
     */
    class Search
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

        auto expand() -> SearchStatus;
        auto enter_next_child() -> bool;

    public:
        explicit Search(State &, Propagators &, BranchCallback branch, TraceCallback trace,
            Stats & stats, std::atomic<bool> * optional_abort_flag = nullptr);
        ~Search();

        Search(const Search &) = delete;
        auto operator=(const Search &) -> Search & = delete;

        /**
         * Carry on searching. Once Exhausted or Aborted has been returned,
         * keeps returning it.
         */
        auto next() -> SearchStatus;

        /**
         * How many decisions are we currently under?
         */
        [[nodiscard]] auto depth() const -> unsigned long long;

        /**
         * Backtrack all the way to the top and forget every decision. After
         * this, next() gives Aborted.
         */
        auto abandon() -> void;
    };
}

#endif
