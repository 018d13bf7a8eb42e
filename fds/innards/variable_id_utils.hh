#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_VARIABLE_ID_UTILS_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_VARIABLE_ID_UTILS_HH

#include <fds/variable_id.hh>

#include <string>
#include <utility>

namespace fds::innards
{
    /**
     * Split an IntegerVariableID into the variable it is a view of, and the
     * constant that is added to that variable's value.
     *
     * \ingroup Innards
     */
    [[nodiscard]] auto deview(const IntegerVariableID &) -> std::pair<SimpleIntegerVariableID, Integer>;

    /**
     * Convert an IntegerVariableID into a roughly-readable string, for debugging.
     *
     * \ingroup Innards
     */
    [[nodiscard]] auto debug_string(const IntegerVariableID &) -> std::string;
}

#endif
