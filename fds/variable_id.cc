/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <fds/variable_id.hh>

using namespace fds;

using std::get;
using std::get_if;

auto fds::operator+(IntegerVariableID v, Integer o) -> IntegerVariableID
{
    // a view of a view is a single view, with the offsets added
    if (auto view = get_if<ViewOfIntegerVariableID>(&v))
        return ViewOfIntegerVariableID{view->actual_variable, view->then_add + o};
    return ViewOfIntegerVariableID{get<SimpleIntegerVariableID>(v), o};
}

auto fds::operator-(IntegerVariableID v, Integer o) -> IntegerVariableID
{
    return v + -o;
}
