#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_STATS_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_STATS_HH

#include <chrono>
#include <iosfwd>

#include <fmt/ostream.h>

namespace fds
{
    /**
     * \brief Statistics from solving.
     *
     * A conflict is a guess whose propagation failed, and a branch is a
     * guess. If completed is false, search stopped before the whole tree
     * was explored, and the counts only cover the part that was searched.
     *
     * \sa fds::solve()
     * \sa fds::solve_with()
     * \ingroup Core
     */
    struct Stats final
    {
        unsigned long long conflicts = 0;
        unsigned long long branches = 0;
        unsigned long long solutions = 0;
        unsigned long long propagations = 0;
        unsigned long long effectful_propagations = 0;
        unsigned long long max_depth = 0;

        unsigned long long n_propagators = 0;

        std::chrono::microseconds solve_time{0};

        bool completed = false;
    };

    /**
     * \brief Stats can be written to an ostream, for convenience.
     *
     * \sa Stats
     * \ingroup Core
     */
    auto operator<<(std::ostream &, const Stats &) -> std::ostream &;
}

template <>
struct fmt::formatter<fds::Stats> : ostream_formatter
{
};

#endif
