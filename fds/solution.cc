#include <fds/innards/variable_id_utils.hh>
#include <fds/solution.hh>

#include <utility>

using namespace fds;
using namespace fds::innards;

using std::move;
using std::string;
using std::vector;
using std::chrono::microseconds;

VariableDoesNotHaveValue::VariableDoesNotHaveValue(const string & w) :
    _wat(w + " does not have a value in this solution")
{
}

auto VariableDoesNotHaveValue::what() const noexcept -> const char *
{
    return _wat.c_str();
}

Solution::Solution(vector<Integer> values, unsigned long long index, microseconds time_since_start) :
    _values(move(values)),
    _index(index),
    _time_since_start(time_since_start)
{
}

auto Solution::operator()(const IntegerVariableID & var) const -> Integer
{
    auto [actual_var, offset] = deview(var);
    if (actual_var.index >= _values.size())
        throw VariableDoesNotHaveValue{debug_string(var)};
    return _values[actual_var.index] + offset;
}

auto Solution::operator()(const vector<IntegerVariableID> & vars) const -> vector<Integer>
{
    vector<Integer> result;
    result.reserve(vars.size());
    for (auto & v : vars)
        result.push_back((*this)(v));
    return result;
}

auto Solution::index() const -> unsigned long long
{
    return _index;
}

auto Solution::time_since_start() const -> microseconds
{
    return _time_since_start;
}

auto Solution::values() const -> const vector<Integer> &
{
    return _values;
}
