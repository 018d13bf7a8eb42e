#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_INTEGER_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_INTEGER_HH

#include <ostream>
#include <string>

namespace fds
{
    /**
     * \brief Wrapper class around domain values, so that values, indices and
     * counts cannot be mixed up by accident.
     *
     * Use fds::operator""_i to create a literal, for example 42_i.
     *
     * \ingroup Core
     */
    struct Integer final
    {
        long long raw_value;

        explicit constexpr Integer(long long v) :
            raw_value(v)
        {
        }

        [[nodiscard]] auto to_string() const -> std::string
        {
            return std::to_string(raw_value);
        }

        [[nodiscard]] constexpr auto operator<=>(const Integer &) const = default;

        auto operator++() -> Integer &
        {
            ++raw_value;
            return *this;
        }

        auto operator--() -> Integer &
        {
            --raw_value;
            return *this;
        }
    };

    [[nodiscard]] constexpr inline auto operator+(Integer a, Integer b) -> Integer
    {
        return Integer{a.raw_value + b.raw_value};
    }

    [[nodiscard]] constexpr inline auto operator-(Integer a, Integer b) -> Integer
    {
        return Integer{a.raw_value - b.raw_value};
    }

    [[nodiscard]] constexpr inline auto operator-(Integer a) -> Integer
    {
        return Integer{-a.raw_value};
    }

    /**
     * \brief An Integer can be written to an ostream.
     */
    inline auto operator<<(std::ostream & s, Integer i) -> std::ostream &
    {
        return s << i.raw_value;
    }

    /**
     * \brief An Integer can be used with libfmt.
     */
    constexpr inline auto format_as(Integer i) -> long long
    {
        return i.raw_value;
    }

    /**
     * \brief Create an Integer from a literal.
     */
    [[nodiscard]] constexpr inline auto operator"" _i(unsigned long long v) -> Integer
    {
        return Integer(static_cast<long long>(v));
    }
}

#endif
