#include <fds/constraints/not_equals.hh>
#include <fds/innards/propagators.hh>
#include <fds/innards/state.hh>
#include <fds/innards/variable_id_utils.hh>

using namespace fds;
using namespace fds::innards;

using std::make_unique;
using std::string;
using std::unique_ptr;

NotEquals::NotEquals(const IntegerVariableID v1, const IntegerVariableID v2) :
    _v1(v1),
    _v2(v2)
{
}

auto NotEquals::clone() const -> unique_ptr<Constraint>
{
    return make_unique<NotEquals>(_v1, _v2);
}

auto NotEquals::describe() const -> string
{
    return "not equals";
}

auto NotEquals::install(Propagators & propagators, State & initial_state) && -> void
{
    check_variables_exist(initial_state, {_v1, _v2}, describe());

    auto [actual1, offset1] = deview(_v1);
    auto [actual2, offset2] = deview(_v2);
    if (actual1 == actual2) {
        // x + a != x + b holds everywhere or nowhere
        if (offset1 == offset2)
            propagators.model_contradiction("NotEquals on " + initial_state.describe(_v1) + " and itself");
        return;
    }

    Triggers triggers;
    triggers.on_change = {_v1, _v2};

    propagators.install(
        [v1 = _v1, v2 = _v2](State & state) -> PropagationResult {
            if (auto value1 = state.optional_single_value(v1))
                return propagation_result_from(state.infer_not_equal(v2, *value1));
            if (auto value2 = state.optional_single_value(v2))
                return propagation_result_from(state.infer_not_equal(v1, *value2));
            return PropagationResult::Unchanged;
        },
        [v1 = _v1, v2 = _v2](const State & state) -> bool {
            auto value1 = state.optional_single_value(v1);
            auto value2 = state.optional_single_value(v2);
            return ! (value1 && value2 && *value1 == *value2);
        },
        triggers, describe());
}
