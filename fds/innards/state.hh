#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_STATE_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_STATE_HH

#include <fds/innards/state-fwd.hh>
#include <fds/integer.hh>
#include <fds/variable_id.hh>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fds::innards
{
    /**
     * \defgroup Innards Solver innards
     */

    /**
     * \brief What happened to a variable's domain when we inferred something
     * about it.
     *
     * \ingroup Innards
     */
    enum class Inference
    {
        NoChange,
        DomainChanged,
        Instantiated,
        Contradiction
    };

    /**
     * The most values a single variable's domain may span, from its smallest
     * to its largest value.
     *
     * \ingroup Innards
     */
    constexpr unsigned long long max_domain_size = 1ull << 24;

    /**
     * Does the range from lower to upper (inclusive) span more than
     * max_domain_size values? Safe for any lower <= upper, including the
     * full range of long long.
     *
     * \ingroup Innards
     */
    [[nodiscard]] auto domain_too_large(Integer lower, Integer upper) -> bool;

    /**
     * \brief Used to indicate a point for backtracking.
     *
     * \sa State::new_epoch()
     * \sa State::backtrack()
     * \ingroup Innards
     */
    struct Timestamp
    {
        unsigned long long trail_size;
        unsigned long long how_many_guesses;

        explicit Timestamp(unsigned long long t, unsigned long long g) :
            trail_size(t),
            how_many_guesses(g)
        {
        }
    };

    /**
     * \brief Keeps track of the live domain of every variable, at a point
     * inside search.
     *
     * Every value removed from a domain is recorded on a trail, so
     * backtracking to a Timestamp puts back exactly the values removed since
     * then, rather than copying domains at every decision. The State also
     * remembers which variables have changed since the propagation engine
     * last asked, so that only the constraints that care are run again.
     *
     * A variable is considered to be assigned exactly when its domain has a
     * single value left.
     *
     * \ingroup Innards
     */
    class State
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

        [[nodiscard]] auto remove_value(SimpleIntegerVariableID, Integer) -> Inference;

    public:
        /**
         * \name Constructors, destructors, etc.
         */
        ///@{

        explicit State();
        State(State &&) noexcept;
        ~State();

        State(const State &) = delete;
        auto operator=(const State &) -> State & = delete;

        /**
         * Used by Problem::create_state_for_new_search() to give each search
         * its own copy of the initial domains. Only legal at the top level,
         * with no guesses made.
         */
        [[nodiscard]] auto clone() const -> State;

        ///@}

        /**
         * \name Variable management.
         */
        ///@{

        /**
         * Used by Problem::create_integer_variable(), which you should be
         * calling instead of this. Throws InvalidDomain if lower > upper, or
         * if the range is too large.
         */
        [[nodiscard]] auto allocate_integer_variable_with_state(Integer lower, Integer upper) -> SimpleIntegerVariableID;

        /**
         * Used by Problem::create_integer_variable(), for a domain given as a
         * non-empty list of values. Duplicate values are ignored. Throws
         * InvalidDomain if the values are spread over too large a range.
         */
        [[nodiscard]] auto allocate_integer_variable_with_state(const std::vector<Integer> & values) -> SimpleIntegerVariableID;

        /**
         * Give a variable a name, which describe() will use in place of its
         * index.
         */
        auto name_variable(SimpleIntegerVariableID, const std::string &) -> void;

        /**
         * A readable description of a variable or a view, using its name if
         * it has one, for use in error messages.
         */
        [[nodiscard]] auto describe(const IntegerVariableID &) const -> std::string;

        /**
         * How many variables are we tracking?
         */
        [[nodiscard]] auto number_of_variables() const -> unsigned long long;

        /**
         * Does this IntegerVariableID refer to something we are tracking?
         */
        [[nodiscard]] auto has_variable(const IntegerVariableID &) const -> bool;

        ///@}

        /**
         * \name Inference
         */
        ///@{

        /**
         * Remove a value from a variable's domain. Removing the last value
         * gives Inference::Contradiction, and leaves the domain alone.
         */
        [[nodiscard]] auto infer_not_equal(const IntegerVariableID &, Integer value) -> Inference;

        /**
         * Reduce a variable's domain to a single value, or throw
         * ValueOutOfDomain if the value is not currently present.
         */
        auto assign(const IntegerVariableID &, Integer value) -> Inference;

        ///@}

        /**
         * \name Branching and guessing.
         */
        ///@{

        /**
         * Assign a variable as a search decision, and remember that we did
         * so. Does not deal with backtracking directly.
         *
         * \sa State::new_epoch()
         */
        auto guess(const IntegerVariableID &, Integer value) -> void;

        /**
         * Call the callback for each guess we are currently under, outermost
         * first.
         */
        auto for_each_guess(const std::function<auto(const IntegerVariableID &, Integer)->void> &) const -> void;

        /**
         * Create a point that can be backtracked to.
         */
        [[nodiscard]] auto new_epoch() -> Timestamp;

        /**
         * Restore every domain to how it was when the Timestamp was created,
         * and forget any guesses made since. Also forgets which variables
         * have changed, since nothing has changed relative to that point.
         */
        auto backtrack(Timestamp) -> void;

        ///@}

        /**
         * \name Change tracking, for propagation.
         */
        ///@{

        /**
         * Call the callback once for each variable whose domain has changed
         * since this was last called, and then forget about them.
         */
        auto extract_changed_variables(const std::function<auto(SimpleIntegerVariableID)->void> &) -> void;

        ///@}

        /**
         * \name Variable state queries.
         */
        ///@{

        [[nodiscard]] auto lower_bound(const IntegerVariableID &) const -> Integer;

        [[nodiscard]] auto upper_bound(const IntegerVariableID &) const -> Integer;

        [[nodiscard]] auto bounds(const IntegerVariableID &) const -> std::pair<Integer, Integer>;

        [[nodiscard]] auto in_domain(const IntegerVariableID &, Integer) const -> bool;

        /**
         * How many values are left in this variable's domain?
         */
        [[nodiscard]] auto domain_size(const IntegerVariableID &) const -> Integer;

        /**
         * Does this variable have a single value left in its domain, and if
         * so, what is it?
         */
        [[nodiscard]] auto optional_single_value(const IntegerVariableID &) const -> std::optional<Integer>;

        [[nodiscard]] auto has_single_value(const IntegerVariableID &) const -> bool;

        /**
         * Call the callback for each value present in a variable's domain,
         * in ascending order. The domain must not be modified by the
         * callback.
         */
        auto for_each_value(const IntegerVariableID &, const std::function<auto(Integer)->void> &) const -> void;

        /**
         * Return the current domain, in ascending order.
         */
        [[nodiscard]] auto copy_of_values(const IntegerVariableID &) const -> std::vector<Integer>;

        /**
         * Return the single value held by this IntegerVariableID, or throw
         * UnexpectedException.
         */
        [[nodiscard]] auto operator()(const IntegerVariableID &) const -> Integer;

        ///@}
    };
}

#endif
