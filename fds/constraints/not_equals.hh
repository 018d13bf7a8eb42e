#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINTS_NOT_EQUALS_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_CONSTRAINTS_NOT_EQUALS_HH

#include <fds/constraint.hh>
#include <fds/variable_id.hh>

#include <memory>
#include <string>

namespace fds
{
    /**
     * \brief Constrain that two variables are not equal.
     *
     * Either side may be a view, so `NotEquals{x + 1_i, y}` is allowed. Once
     * one side is assigned, its value is removed from the other side.
     *
     * \ingroup Constraints
     */
    class NotEquals : public Constraint
    {
    private:
        IntegerVariableID _v1, _v2;

    public:
        NotEquals(const IntegerVariableID v1, const IntegerVariableID v2);

        virtual auto install(innards::Propagators &, innards::State &) && -> void override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
