#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_VARIABLE_ID_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_VARIABLE_ID_HH

#include <fds/integer.hh>

#include <variant>

namespace fds
{
    /**
     * \brief A VariableID corresponding to a genuine variable in a Problem.
     *
     * The index is the variable's position in declaration order.
     *
     * \sa IntegerVariableID
     * \ingroup Core
     */
    struct SimpleIntegerVariableID final
    {
        unsigned long long index;

        constexpr explicit SimpleIntegerVariableID(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] constexpr auto operator<=>(const SimpleIntegerVariableID &) const = default;
    };

    /**
     * \brief A SimpleIntegerVariableID with a constant added to its value.
     *
     * Usually this will be constructed using `var + 3_i` or `var - 3_i`, and
     * is how affine members such as the diagonals in n-queens are expressed.
     *
     * \sa IntegerVariableID
     * \ingroup Core
     */
    struct ViewOfIntegerVariableID final
    {
        SimpleIntegerVariableID actual_variable;
        Integer then_add;

        constexpr explicit ViewOfIntegerVariableID(SimpleIntegerVariableID a, Integer o) :
            actual_variable(a),
            then_add(o)
        {
        }

        [[nodiscard]] constexpr auto operator<=>(const ViewOfIntegerVariableID &) const = default;
    };

    /**
     * An IntegerVariableID is either a SimpleIntegerVariableID or a
     * ViewOfIntegerVariableID. Constraints accept either.
     *
     * \ingroup Core
     */
    using IntegerVariableID = std::variant<SimpleIntegerVariableID, ViewOfIntegerVariableID>;

    /**
     * \brief Produce an IntegerVariableID that is the same except with its
     * value offset by a constant. Offsets on views accumulate.
     *
     * \ingroup Core
     */
    [[nodiscard]] auto operator+(IntegerVariableID v, Integer offset) -> IntegerVariableID;

    /**
     * \brief Produce an IntegerVariableID that is the same except with its
     * value offset by a negated constant.
     *
     * \ingroup Core
     */
    [[nodiscard]] auto operator-(IntegerVariableID v, Integer offset) -> IntegerVariableID;
}

#endif
