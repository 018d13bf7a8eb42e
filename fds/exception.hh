#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_EXCEPTION_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_EXCEPTION_HH

#include <fds/integer.hh>
#include <fds/stats.hh>

#include <exception>
#include <source_location>
#include <string>

namespace fds
{
    /**
     * \brief Thrown if something has gone wrong. This usually indicates a bug
     * in the solver, or a model that refers to things it does not own.
     *
     * \ingroup Core
     */
    class UnexpectedException : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit UnexpectedException(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown if a switch statement is missing a case entry. This usually
     * indicates a bug in the solver.
     *
     * \ingroup Core
     */
    class NonExhaustiveSwitch : public UnexpectedException
    {
    public:
        explicit NonExhaustiveSwitch(const std::source_location & = std::source_location::current());
    };

    /**
     * \brief Thrown when creating a variable whose domain is malformed, for
     * example with lower > upper, or from an empty list of values. Nothing
     * has been added to the Problem when this is thrown.
     *
     * \ingroup Core
     */
    class InvalidDomain : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit InvalidDomain(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown if search tries to assign a value that is not in the
     * variable's current domain. This is always a bug in the solver.
     *
     * \ingroup Core
     */
    class ValueOutOfDomain : public UnexpectedException
    {
    public:
        explicit ValueOutOfDomain(const std::string & variable, Integer value);
    };

    /**
     * \brief Thrown by fds::solve() and fds::solve_with() if the solution
     * callback throws. The callback's exception is nested inside, and can be
     * recovered using std::rethrow_if_nested().
     *
     * The statistics cover the search up to the failure, and are marked as
     * not completed.
     *
     * \ingroup Core
     */
    class CallbackFailure : public std::exception
    {
    private:
        std::string _wat;
        Stats _partial_stats;

    public:
        explicit CallbackFailure(const std::string &, const Stats &);

        virtual auto what() const noexcept -> const char * override;

        [[nodiscard]] auto partial_stats() const -> const Stats &;
    };
}

#endif
