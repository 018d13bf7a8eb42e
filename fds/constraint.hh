#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINT_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINT_HH

#include <fds/innards/propagators-fwd.hh>
#include <fds/innards/state-fwd.hh>
#include <fds/variable_id.hh>

#include <memory>
#include <string>
#include <vector>

namespace fds
{
    /**
     * \defgroup Constraints Constraints
     */

    /**
     * \brief Subclasses of Constraint give a high level way of defining
     * constraints. See \ref Constraints for a list of available constraints.
     *
     * A Constraint subclass instance should only be used by passing it to
     * Problem::post(), which keeps a clone. Each time the Problem is solved,
     * that clone is cloned again and Constraint::install() is called on the
     * copy, which in turn defines zero or more propagators that do the actual
     * work.
     *
     * \ingroup Core
     */
    class [[nodiscard]] Constraint
    {
    public:
        virtual ~Constraint() = 0;

        /**
         * Called internally to install the constraint. This is a destructive
         * operation which can only be called once, and after calling it
         * neither install() nor clone() may be called on this instance.
         */
        virtual auto install(innards::Propagators &, innards::State &) && -> void = 0;

        /**
         * Create a copy of the constraint. To be used internally.
         */
        [[nodiscard]] virtual auto clone() const -> std::unique_ptr<Constraint> = 0;

        /**
         * A short human-readable description, for diagnostics.
         */
        [[nodiscard]] virtual auto describe() const -> std::string = 0;
    };

    namespace innards
    {
        /**
         * Throw UnexpectedException if any of these variables is not tracked
         * by the State. Used by Constraint::install() implementations.
         */
        auto check_variables_exist(const State &, const std::vector<IntegerVariableID> &, const std::string & constraint_name) -> void;
    }
}

#endif
