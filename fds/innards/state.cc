#include <fds/exception.hh>
#include <fds/innards/state.hh>
#include <fds/innards/variable_id_utils.hh>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace fds;
using namespace fds::innards;

using std::function;
using std::max;
using std::min;
using std::minmax_element;
using std::move;
using std::nullopt;
using std::optional;
using std::pair;
using std::string;
using std::to_string;
using std::vector;

namespace
{
    // Domains are small, so a value is present iff its bit, counted from the
    // smallest value the variable ever had, is set.
    struct IntegerVariableState
    {
        Integer origin;
        vector<bool> present;
        Integer size;
        Integer lower;
        Integer upper;

        [[nodiscard]] auto contains(Integer v) const -> bool
        {
            return v >= lower && v <= upper && present[(v - origin).raw_value];
        }

        // walks bit positions, so an upper bound of LLONG_MAX does not overflow
        template <typename F_>
        auto for_each_present(const F_ & f) const -> void
        {
            for (auto i = (lower - origin).raw_value, i_end = (upper - origin).raw_value; i <= i_end; ++i)
                if (present[i])
                    f(origin + Integer{i});
        }
    };
}

auto fds::innards::domain_too_large(Integer lower, Integer upper) -> bool
{
    // unsigned, so that the full range of long long does not overflow
    auto width = static_cast<unsigned long long>(upper.raw_value) - static_cast<unsigned long long>(lower.raw_value);
    return width >= max_domain_size;
}

struct State::Imp
{
    vector<IntegerVariableState> variables{};
    vector<optional<string>> names{};
    vector<pair<SimpleIntegerVariableID, Integer>> trail{};
    vector<pair<IntegerVariableID, Integer>> guesses{};
    vector<SimpleIntegerVariableID> changed{};
    vector<bool> is_changed{};

    auto state_of(SimpleIntegerVariableID v) -> IntegerVariableState &
    {
        if (v.index >= variables.size())
            throw UnexpectedException{"variable index " + to_string(v.index) + " is not in this state"};
        return variables[v.index];
    }

    auto state_of(SimpleIntegerVariableID v) const -> const IntegerVariableState &
    {
        if (v.index >= variables.size())
            throw UnexpectedException{"variable index " + to_string(v.index) + " is not in this state"};
        return variables[v.index];
    }

    auto mark_changed(SimpleIntegerVariableID v) -> void
    {
        if (! is_changed[v.index]) {
            is_changed[v.index] = true;
            changed.push_back(v);
        }
    }
};

State::State() :
    _imp(new Imp{})
{
}

State::State(State && other) noexcept :
    _imp(move(other._imp))
{
}

State::~State() = default;

auto State::clone() const -> State
{
    if (! _imp->guesses.empty())
        throw UnexpectedException{"can only clone a state with no guesses"};

    auto result = State{};
    result._imp->variables = _imp->variables;
    result._imp->names = _imp->names;
    result._imp->trail = _imp->trail;
    result._imp->is_changed.resize(_imp->variables.size(), false);
    return result;
}

auto State::allocate_integer_variable_with_state(Integer lower, Integer upper) -> SimpleIntegerVariableID
{
    if (lower > upper)
        throw InvalidDomain{"variable has lower bound " + lower.to_string() + " > upper bound " + upper.to_string()};
    if (domain_too_large(lower, upper))
        throw InvalidDomain{"variable from " + lower.to_string() + " to " + upper.to_string() + " spans more than " +
            to_string(max_domain_size) + " values"};

    IntegerVariableState s{lower, vector<bool>((upper - lower).raw_value + 1, true), upper - lower + 1_i, lower, upper};
    _imp->variables.push_back(move(s));
    _imp->names.emplace_back(nullopt);
    _imp->is_changed.push_back(false);
    return SimpleIntegerVariableID{_imp->variables.size() - 1};
}

auto State::allocate_integer_variable_with_state(const vector<Integer> & values) -> SimpleIntegerVariableID
{
    if (values.empty())
        throw UnexpectedException{"can't allocate a variable with no values"};

    auto [min_iter, max_iter] = minmax_element(values.begin(), values.end());
    if (domain_too_large(*min_iter, *max_iter))
        throw InvalidDomain{"variable values from " + min_iter->to_string() + " to " + max_iter->to_string() +
            " span more than " + to_string(max_domain_size) + " values"};

    IntegerVariableState s{*min_iter, vector<bool>((*max_iter - *min_iter).raw_value + 1, false), 0_i, *min_iter, *max_iter};
    for (auto & v : values)
        if (! s.present[(v - s.origin).raw_value]) {
            s.present[(v - s.origin).raw_value] = true;
            ++s.size;
        }

    _imp->variables.push_back(move(s));
    _imp->names.emplace_back(nullopt);
    _imp->is_changed.push_back(false);
    return SimpleIntegerVariableID{_imp->variables.size() - 1};
}

auto State::name_variable(SimpleIntegerVariableID var, const string & name) -> void
{
    if (var.index >= _imp->names.size())
        throw UnexpectedException{"variable index " + to_string(var.index) + " is not in this state"};
    _imp->names[var.index] = name;
}

auto State::describe(const IntegerVariableID & var) const -> string
{
    auto [actual_var, offset] = deview(var);
    if (actual_var.index >= _imp->names.size() || ! _imp->names[actual_var.index])
        return debug_string(var);

    auto & name = *_imp->names[actual_var.index];
    if (offset == 0_i)
        return name;
    else if (offset > 0_i)
        return name + " + " + offset.to_string();
    else
        return name + " - " + (-offset).to_string();
}

auto State::number_of_variables() const -> unsigned long long
{
    return _imp->variables.size();
}

auto State::has_variable(const IntegerVariableID & var) const -> bool
{
    return deview(var).first.index < _imp->variables.size();
}

auto State::remove_value(SimpleIntegerVariableID var, Integer value) -> Inference
{
    auto & s = _imp->state_of(var);
    if (! s.contains(value))
        return Inference::NoChange;

    if (s.size == 1_i)
        return Inference::Contradiction;

    s.present[(value - s.origin).raw_value] = false;
    --s.size;
    _imp->trail.emplace_back(var, value);
    _imp->mark_changed(var);

    if (value == s.lower)
        do
            ++s.lower;
        while (! s.present[(s.lower - s.origin).raw_value]);

    if (value == s.upper)
        do
            --s.upper;
        while (! s.present[(s.upper - s.origin).raw_value]);

    return s.size == 1_i ? Inference::Instantiated : Inference::DomainChanged;
}

auto State::infer_not_equal(const IntegerVariableID & var, Integer value) -> Inference
{
    auto [actual_var, offset] = deview(var);
    return remove_value(actual_var, value - offset);
}

auto State::assign(const IntegerVariableID & var, Integer value) -> Inference
{
    auto [actual_var, offset] = deview(var);
    auto actual_value = value - offset;

    auto & s = _imp->state_of(actual_var);
    if (! s.contains(actual_value))
        throw ValueOutOfDomain{describe(actual_var), actual_value};

    if (s.size == 1_i)
        return Inference::NoChange;

    vector<Integer> to_remove;
    s.for_each_present([&](Integer v) {
        if (v != actual_value)
            to_remove.push_back(v);
    });

    for (auto & v : to_remove)
        if (Inference::Contradiction == remove_value(actual_var, v))
            throw UnexpectedException{"contradiction while assigning " + describe(var)};

    return Inference::Instantiated;
}

auto State::guess(const IntegerVariableID & var, Integer value) -> void
{
    assign(var, value);
    _imp->guesses.emplace_back(var, value);
}

auto State::for_each_guess(const function<auto(const IntegerVariableID &, Integer)->void> & f) const -> void
{
    for (auto & [var, value] : _imp->guesses)
        f(var, value);
}

auto State::new_epoch() -> Timestamp
{
    return Timestamp{_imp->trail.size(), _imp->guesses.size()};
}

auto State::backtrack(Timestamp t) -> void
{
    while (_imp->trail.size() > t.trail_size) {
        auto [var, value] = _imp->trail.back();
        _imp->trail.pop_back();

        auto & s = _imp->variables[var.index];
        s.present[(value - s.origin).raw_value] = true;
        ++s.size;
        s.lower = min(s.lower, value);
        s.upper = max(s.upper, value);
    }

    _imp->guesses.erase(_imp->guesses.begin() + t.how_many_guesses, _imp->guesses.end());

    for (auto & v : _imp->changed)
        _imp->is_changed[v.index] = false;
    _imp->changed.clear();
}

auto State::extract_changed_variables(const function<auto(SimpleIntegerVariableID)->void> & f) -> void
{
    auto changed = move(_imp->changed);
    _imp->changed.clear();
    for (auto & v : changed)
        _imp->is_changed[v.index] = false;
    for (auto & v : changed)
        f(v);
}

auto State::lower_bound(const IntegerVariableID & var) const -> Integer
{
    auto [actual_var, offset] = deview(var);
    return _imp->state_of(actual_var).lower + offset;
}

auto State::upper_bound(const IntegerVariableID & var) const -> Integer
{
    auto [actual_var, offset] = deview(var);
    return _imp->state_of(actual_var).upper + offset;
}

auto State::bounds(const IntegerVariableID & var) const -> pair<Integer, Integer>
{
    auto [actual_var, offset] = deview(var);
    auto & s = _imp->state_of(actual_var);
    return pair{s.lower + offset, s.upper + offset};
}

auto State::in_domain(const IntegerVariableID & var, Integer value) const -> bool
{
    auto [actual_var, offset] = deview(var);
    return _imp->state_of(actual_var).contains(value - offset);
}

auto State::domain_size(const IntegerVariableID & var) const -> Integer
{
    return _imp->state_of(deview(var).first).size;
}

auto State::optional_single_value(const IntegerVariableID & var) const -> optional<Integer>
{
    auto [actual_var, offset] = deview(var);
    auto & s = _imp->state_of(actual_var);
    if (s.size == 1_i)
        return s.lower + offset;
    else
        return nullopt;
}

auto State::has_single_value(const IntegerVariableID & var) const -> bool
{
    return domain_size(var) == 1_i;
}

auto State::for_each_value(const IntegerVariableID & var, const function<auto(Integer)->void> & f) const -> void
{
    auto [actual_var, offset] = deview(var);
    auto & s = _imp->state_of(actual_var);
    s.for_each_present([&](Integer v) { f(v + offset); });
}

auto State::copy_of_values(const IntegerVariableID & var) const -> vector<Integer>
{
    vector<Integer> result;
    result.reserve(domain_size(var).raw_value);
    for_each_value(var, [&](Integer v) { result.push_back(v); });
    return result;
}

auto State::operator()(const IntegerVariableID & var) const -> Integer
{
    if (auto result = optional_single_value(var))
        return *result;
    throw UnexpectedException{describe(var) + " does not have a single value"};
}
