#include <fds/constraints/all_different.hh>
#include <fds/innards/propagators.hh>
#include <fds/innards/state.hh>

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

using namespace fds;
using namespace fds::innards;

using std::adjacent_find;
using std::make_unique;
using std::move;
using std::optional;
using std::sort;
using std::string;
using std::unique_ptr;
using std::vector;

auto fds::innards::propagate_value_all_different(const vector<IntegerVariableID> & members, State & state) -> PropagationResult
{
    auto result = PropagationResult::Unchanged;

    // A member is done once its value has been removed from everyone else.
    vector<bool> done(members.size(), false);
    bool assigned_something = true;
    while (assigned_something) {
        assigned_something = false;

        for (std::size_t i = 0; i < members.size(); ++i) {
            if (done[i])
                continue;

            auto value = state.optional_single_value(members[i]);
            if (! value)
                continue;

            done[i] = true;
            for (std::size_t j = 0; j < members.size(); ++j) {
                if (j == i)
                    continue;

                switch (state.infer_not_equal(members[j], *value)) {
                case Inference::NoChange:
                    break;
                case Inference::DomainChanged:
                    result = PropagationResult::Reduced;
                    break;
                case Inference::Instantiated:
                    result = PropagationResult::Reduced;
                    assigned_something = true;
                    break;
                case Inference::Contradiction:
                    return PropagationResult::Contradiction;
                }
            }
        }
    }

    return result;
}

AllDifferent::AllDifferent(vector<IntegerVariableID> m) :
    _members(move(m))
{
}

auto AllDifferent::clone() const -> unique_ptr<Constraint>
{
    return make_unique<AllDifferent>(_members);
}

auto AllDifferent::describe() const -> string
{
    return "all different";
}

auto AllDifferent::install(Propagators & propagators, State & initial_state) && -> void
{
    check_variables_exist(initial_state, _members, describe());

    if (_members.size() < 2)
        return;

    Triggers triggers;
    triggers.on_change = _members;

    propagators.install(
        [members = _members](State & state) -> PropagationResult {
            return propagate_value_all_different(members, state);
        },
        [members = _members](const State & state) -> bool {
            vector<Integer> values;
            for (auto & m : members)
                if (auto value = state.optional_single_value(m))
                    values.push_back(*value);
            sort(values.begin(), values.end());
            return values.end() == adjacent_find(values.begin(), values.end());
        },
        triggers, describe());
}
