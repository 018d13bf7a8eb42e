#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_SOLUTION_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_SOLUTION_HH

#include <fds/integer.hh>
#include <fds/variable_id.hh>

#include <chrono>
#include <exception>
#include <string>
#include <vector>

namespace fds
{
    /**
     * \brief Thrown by Solution::operator() if asked about a variable that
     * the Solution does not hold.
     *
     * \ingroup Core
     */
    class VariableDoesNotHaveValue : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit VariableDoesNotHaveValue(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief A complete assignment, given to the solution callback.
     *
     * This is a snapshot: it holds a copy of the value of every variable in
     * the Problem, and does not refer back to the solver, so it can be kept
     * after the callback returns.
     *
     * \ingroup Core
     */
    class Solution
    {
    private:
        std::vector<Integer> _values;
        unsigned long long _index;
        std::chrono::microseconds _time_since_start;

    public:
        explicit Solution(std::vector<Integer> values, unsigned long long index, std::chrono::microseconds time_since_start);

        /**
         * \brief Fetch a variable's value, or the value of a view.
         */
        [[nodiscard]] auto operator()(const IntegerVariableID &) const -> Integer;

        /**
         * \brief Fetch the values for a vector of variables.
         */
        [[nodiscard]] auto operator()(const std::vector<IntegerVariableID> &) const -> std::vector<Integer>;

        /**
         * \brief Which solution is this? The first solution found is 0.
         */
        [[nodiscard]] auto index() const -> unsigned long long;

        /**
         * \brief How long after solving started was this solution found?
         * Every solution is timed from the same starting point, and this
         * includes time spent in earlier callbacks.
         */
        [[nodiscard]] auto time_since_start() const -> std::chrono::microseconds;

        /**
         * \brief Every variable's value, in the order the variables were created.
         */
        [[nodiscard]] auto values() const -> const std::vector<Integer> &;
    };
}

#endif
