#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_PROBLEM_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_PROBLEM_HH

#include <fds/constraint.hh>
#include <fds/innards/propagators-fwd.hh>
#include <fds/innards/state-fwd.hh>
#include <fds/integer.hh>
#include <fds/variable_id.hh>

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fds
{
    /**
     * \defgroup Core Core functionality
     */

    /**
     * \brief Thrown if a variable name is duplicated or contains strange
     * characters.
     *
     * \ingroup Core
     */
    class NamingError : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit NamingError(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief The central class which defines a constraint satisfaction problem
     * instance to be solved.
     *
     * Variables and constraints are added first, and then the Problem is
     * passed to fds::solve() or fds::solve_with(). Solving does not change
     * the Problem, so it can be solved again, but not from inside one of its
     * own solve callbacks.
     *
     * \ingroup Core
     */
    class Problem
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

        auto check_name(const std::string &) -> const std::string &;
        auto check_not_solving(const std::string &) const -> void;

    public:
        /**
         * \name Constructors, destructors, etc.
         * @{
         */
        Problem();

        ~Problem();

        Problem(const Problem &) = delete;
        Problem & operator=(const Problem &) = delete;

        ///@}

        /**
         * \name For end users.
         *@{
         */

        /**
         * \brief Add a clone of this Constraint to the model.
         */
        auto post(const Constraint &) -> void;

        /**
         * \brief Create a new integer variable, whose domain goes from lower to
         * upper (inclusive). Throws InvalidDomain if lower > upper, or if
         * the domain would span more than innards::max_domain_size values.
         * The final argument gives an optional name that will appear in
         * some output.
         */
        [[nodiscard]] auto create_integer_variable(
            Integer lower,
            Integer upper,
            const std::optional<std::string> & name = std::nullopt) -> SimpleIntegerVariableID;

        /**
         * \brief Create a new integer variable, whose domain is selected from
         * among the chosen values. Throws InvalidDomain if there are no
         * values, or if they are spread over more than
         * innards::max_domain_size values.
         */
        [[nodiscard]] auto create_integer_variable(
            const std::vector<Integer> & domain,
            const std::optional<std::string> & name = std::nullopt) -> SimpleIntegerVariableID;

        /**
         * \brief Create a vector of how_many integer variables, each of
         * whose domain goes from lower to upper (inclusive). If a name is
         * given, the variables are called name[0], name[1] and so on.
         */
        [[nodiscard]] auto create_integer_variable_vector(
            std::size_t how_many,
            Integer lower,
            Integer upper,
            const std::optional<std::string> & name = std::nullopt) -> std::vector<IntegerVariableID>;

        /**
         * \brief The name of a variable, which is a number if it was not
         * given one.
         */
        [[nodiscard]] auto name_of(SimpleIntegerVariableID) const -> const std::string &;

        ///@}

        /**
         * \name For use by the innards.
         * @{
         */

        [[nodiscard]] auto create_state_for_new_search() const -> innards::State;

        [[nodiscard]] auto create_propagators(innards::State &) const -> innards::Propagators;

        /**
         * Every variable, in the order they were created.
         */
        [[nodiscard]] auto all_normal_variables() const -> const std::vector<IntegerVariableID> &;

        [[nodiscard]] auto number_of_constraints() const -> std::size_t;

        /**
         * Used by fds::solve_with() to refuse to solve a Problem from inside
         * one of its own callbacks. Throws UnexpectedException if a solve is
         * already in progress.
         */
        auto begin_solving() -> void;

        auto end_solving() -> void;

        ///@}
    };
}

#endif
