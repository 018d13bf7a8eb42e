#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINTS_ALL_DIFFERENT_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINTS_ALL_DIFFERENT_HH

#include <fds/constraint.hh>
#include <fds/innards/propagators-fwd.hh>
#include <fds/innards/state-fwd.hh>
#include <fds/variable_id.hh>

#include <memory>
#include <string>
#include <vector>

namespace fds
{
    namespace innards
    {
        enum class PropagationResult;

        /**
         * Remove the value of every assigned member from every other member,
         * carrying on if this assigns further members. Gives a contradiction
         * if two assigned members share a value.
         */
        [[nodiscard]] auto propagate_value_all_different(
            const std::vector<IntegerVariableID> & members, State & state) -> PropagationResult;
    }

    /**
     * \brief "Value-consistent" all different constraint: each member takes a
     * different value, but only do the minimum pruning to enforce this (only
     * remove the values of assigned members from the domains of the others).
     *
     * Members may be views, so the diagonals for n-queens can be written as
     * `AllDifferent{{q[0] + 0_i, q[1] + 1_i, ...}}`.
     *
     * \ingroup Constraints
     */
    class AllDifferent : public Constraint
    {
    private:
        std::vector<IntegerVariableID> _members;

    public:
        explicit AllDifferent(std::vector<IntegerVariableID> members);

        virtual auto install(innards::Propagators &, innards::State &) && -> void override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
