#include <fds/constraint.hh>
#include <fds/exception.hh>
#include <fds/innards/state.hh>
#include <fds/innards/variable_id_utils.hh>

using std::string;
using std::vector;

using namespace fds;
using namespace fds::innards;

Constraint::~Constraint() = default;

auto fds::innards::check_variables_exist(const State & state, const vector<IntegerVariableID> & vars, const string & constraint_name) -> void
{
    for (auto & v : vars)
        if (! state.has_variable(v))
            throw UnexpectedException{constraint_name + " constraint refers to " + debug_string(v) + ", which is not part of this problem"};
}
