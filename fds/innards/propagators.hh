#ifndef FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_PROPAGATORS_HH
#define FINITE_DOMAIN_SOLVER_GUARD_FDS_INNARDS_PROPAGATORS_HH

#include <fds/innards/propagators-fwd.hh>
#include <fds/innards/state.hh>
#include <fds/stats.hh>
#include <fds/variable_id.hh>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fds::innards
{
    /**
     * \brief What a propagation function did.
     *
     * \ingroup Innards
     */
    enum class PropagationResult
    {
        Unchanged,
        Reduced,
        Contradiction
    };

    /**
     * Turn the outcome of a single State inference into a PropagationResult.
     *
     * \ingroup Innards
     */
    [[nodiscard]] auto propagation_result_from(Inference) -> PropagationResult;

    /**
     * Combine two PropagationResult values, keeping the strongest.
     *
     * \ingroup Innards
     */
    auto increase_result_to(PropagationResult & current, PropagationResult other) -> void;

    /**
     * A propagation function must only remove values that cannot take part
     * in any solution given the current domains, and must not remove
     * anything if called twice in a row with nothing else changing.
     */
    using PropagationFunction = std::function<auto(State &)->PropagationResult>;

    /**
     * A consistency check returns false if the variables that are currently
     * assigned already violate the constraint.
     */
    using ConsistencyFunction = std::function<auto(const State &)->bool>;

    /**
     * \brief Tell Propagators when a Constraint's propagators should be triggered.
     *
     * Every propagator will be called at least once, when search starts, and
     * after that whenever the domain of one of its trigger variables changes.
     *
     * \ingroup Innards
     * \sa Propagators::install
     */
    struct Triggers
    {
        std::vector<IntegerVariableID> on_change = {};
    };

    /**
     * \brief Every Constraint creates one or more propagation functions, which
     * are given to a Propagators instance to manage.
     *
     * Propagation is forward checking driven by a worklist: only propagators
     * whose trigger variables have changed since they last ran are looked at
     * again, until either nothing changes or something contradicts.
     *
     * \ingroup Innards
     */
    class Propagators
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

        auto enqueue(int id) -> void;

    public:
        /**
         * \name Constructors, destructors, etc.
         */
        ///@{
        explicit Propagators();
        ~Propagators();

        Propagators(const Propagators &) = delete;
        auto operator=(const Propagators &) -> Propagators & = delete;

        Propagators(Propagators &&);
        auto operator=(Propagators &&) -> Propagators &;

        ///@}

        /**
         * \name Turning a Constraint into propagators
         */
        ///@{

        /**
         * Install the specified propagation function and its consistency
         * check. The name is only used in diagnostics.
         */
        auto install(PropagationFunction &&, ConsistencyFunction &&, const Triggers & triggers, const std::string & name) -> void;

        /**
         * Can be called by a Constraint if it is contradictory by definition.
         */
        auto model_contradiction(const std::string & explain_yourself) -> void;

        ///@}

        /**
         * \name Propagation
         */
        ///@{

        /**
         * Propagate until either a fixed point or a contradiction is reached.
         * The first call runs everything; after that, only propagators affected by variables that
         * the State says have changed are run. Returns false on contradiction.
         *
         * If the abort flag is set, may stop early and return true without
         * reaching a fixed point.
         */
        [[nodiscard]] auto propagate(State &, std::atomic<bool> * optional_abort_flag = nullptr) -> bool;

        /**
         * Does every constraint's consistency check agree that the current
         * state does not violate it?
         */
        [[nodiscard]] auto is_consistent(const State &) const -> bool;

        ///@}

        /**
         * \name Statistics and information
         */
        ///@{

        /**
         * Populate propagation statistics.
         *
         * \sa Stats
         */
        auto fill_in_constraint_stats(Stats &) const -> void;

        /**
         * How many propagators is this variable a trigger for?
         */
        [[nodiscard]] auto degree_of(const IntegerVariableID &) const -> long;

        [[nodiscard]] auto number_of_propagators() const -> unsigned long long;

        /**
         * The name of the propagator that most recently reported a
         * contradiction, if any.
         */
        [[nodiscard]] auto name_of_last_contradiction() const -> const std::string &;

        ///@}
    };
}

#endif
