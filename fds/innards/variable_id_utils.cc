#include <fds/innards/variable_id_utils.hh>

using namespace fds;
using namespace fds::innards;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::pair;
using std::string;
using std::to_string;

auto fds::innards::deview(const IntegerVariableID & var) -> pair<SimpleIntegerVariableID, Integer>
{
    if (auto view = get_if<ViewOfIntegerVariableID>(&var))
        return pair{view->actual_variable, view->then_add};
    return pair{get<SimpleIntegerVariableID>(var), 0_i};
}

auto fds::innards::debug_string(const IntegerVariableID & var) -> string
{
    auto [actual_var, offset] = deview(var);
    if (offset == 0_i && holds_alternative<SimpleIntegerVariableID>(var))
        return "varidx " + to_string(actual_var.index);
    return "view of varidx " + to_string(actual_var.index) + " plus " + offset.to_string();
}
