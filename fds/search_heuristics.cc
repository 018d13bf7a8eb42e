#include <fds/innards/propagators.hh>
#include <fds/innards/state.hh>
#include <fds/search_heuristics.hh>

#include <algorithm>
#include <tuple>
#include <utility>

using std::move;
using std::nullopt;
using std::optional;
using std::reverse;
using std::tuple;
using std::vector;

using namespace fds;
using namespace fds::innards;

auto fds::branch_with(BranchVariableSelector var, BranchValueGenerator val) -> BranchCallback
{
    return [var = move(var), val = move(val)](const State & s, const Propagators & p) -> optional<Branch> {
        auto branch_var = var(s, p);
        if (branch_var)
            return Branch{*branch_var, val(s, *branch_var)};
        else
            return nullopt;
    };
}

auto fds::branch_sequence(BranchCallback a, BranchCallback b) -> BranchCallback
{
    return [a = move(a), b = move(b)](const State & s, const Propagators & p) -> optional<Branch> {
        if (auto result = a(s, p))
            return result;
        return b(s, p);
    };
}

auto fds::variable_order::in_order_of(vector<IntegerVariableID> vars, VariableComparator comp) -> BranchVariableSelector
{
    return [vars = move(vars), comp = move(comp)](
               const State & state, const Propagators & propagators) -> optional<IntegerVariableID> {
        optional<IntegerVariableID> result;
        for (auto & v : vars) {
            if (state.domain_size(v) < 2_i)
                continue;
            if ((! result) || comp(state, propagators, v, *result))
                result = v;
        }
        return result;
    };
}

auto fds::variable_order::in_order(vector<IntegerVariableID> vars) -> BranchVariableSelector
{
    return [vars = move(vars)](const State & state, const Propagators &) -> optional<IntegerVariableID> {
        for (auto & v : vars)
            if (state.domain_size(v) >= 2_i)
                return v;
        return nullopt;
    };
}

auto fds::variable_order::in_order(const Problem & problem) -> BranchVariableSelector
{
    return in_order(problem.all_normal_variables());
}

auto fds::variable_order::dom(vector<IntegerVariableID> vars) -> BranchVariableSelector
{
    return variable_order::in_order_of(move(vars), [](const State & state, const Propagators &, const IntegerVariableID & a, const IntegerVariableID & b) {
        return state.domain_size(a) < state.domain_size(b);
    });
}

auto fds::variable_order::dom(const Problem & problem) -> BranchVariableSelector
{
    return dom(problem.all_normal_variables());
}

auto fds::variable_order::dom_then_deg(vector<IntegerVariableID> vars) -> BranchVariableSelector
{
    return variable_order::in_order_of(move(vars), [](const State & state, const Propagators & p, const IntegerVariableID & a, const IntegerVariableID & b) {
        return tuple{state.domain_size(a), -p.degree_of(a)} < tuple{state.domain_size(b), -p.degree_of(b)};
    });
}

auto fds::variable_order::dom_then_deg(const Problem & problem) -> BranchVariableSelector
{
    return dom_then_deg(problem.all_normal_variables());
}

auto fds::value_order::smallest_first() -> BranchValueGenerator
{
    return [](const State & s, const IntegerVariableID & var) -> vector<Integer> {
        return s.copy_of_values(var);
    };
}

auto fds::value_order::largest_first() -> BranchValueGenerator
{
    return [](const State & s, const IntegerVariableID & var) -> vector<Integer> {
        auto values = s.copy_of_values(var);
        reverse(values.begin(), values.end());
        return values;
    };
}
