#include <fds/exception.hh>
#include <fds/innards/propagators.hh>
#include <fds/innards/state.hh>
#include <fds/problem.hh>

#include <algorithm>
#include <deque>
#include <regex>
#include <unordered_set>

using namespace fds;
using namespace fds::innards;

using std::deque;
using std::make_optional;
using std::minmax_element;
using std::move;
using std::nullopt;
using std::optional;
using std::regex;
using std::regex_match;
using std::size_t;
using std::string;
using std::to_string;
using std::unique_ptr;
using std::unordered_set;
using std::vector;

NamingError::NamingError(const string & w) :
    _wat(w)
{
}

auto NamingError::what() const noexcept -> const char *
{
    return _wat.c_str();
}

struct Problem::Imp
{
    State initial_state{};
    deque<unique_ptr<Constraint>> constraints{};
    vector<IntegerVariableID> problem_variables{};
    vector<string> variable_names{};
    unordered_set<string> names{};
    bool solving = false;
};

Problem::Problem() :
    _imp(new Imp{})
{
}

Problem::~Problem() = default;

auto Problem::check_not_solving(const string & what) const -> void
{
    if (_imp->solving)
        throw UnexpectedException{"cannot " + what + " while the problem is being solved"};
}

auto Problem::check_name(const string & name) -> const string &
{
    regex allowed{R"(_*[a-zA-Z][a-zA-Z0-9\[\]_\-]*)"};
    if (! regex_match(name, allowed))
        throw NamingError{"illegal variable name '" + name + "'"};

    if (! _imp->names.insert(name).second)
        throw NamingError{"duplicate variable name '" + name + "'"};

    return name;
}

auto Problem::create_integer_variable(Integer lower, Integer upper, const optional<string> & name) -> SimpleIntegerVariableID
{
    check_not_solving("create a variable");
    if (lower > upper)
        throw InvalidDomain{"variable has lower bound " + lower.to_string() + " > upper bound " + upper.to_string()};
    if (domain_too_large(lower, upper))
        throw InvalidDomain{"variable from " + lower.to_string() + " to " + upper.to_string() + " spans more than " +
            to_string(max_domain_size) + " values"};

    auto actual_name = name ? check_name(*name) : to_string(_imp->problem_variables.size());
    auto result = _imp->initial_state.allocate_integer_variable_with_state(lower, upper);
    if (name)
        _imp->initial_state.name_variable(result, actual_name);
    _imp->problem_variables.push_back(result);
    _imp->variable_names.push_back(move(actual_name));
    return result;
}

auto Problem::create_integer_variable(const vector<Integer> & domain, const optional<string> & name) -> SimpleIntegerVariableID
{
    check_not_solving("create a variable");
    if (domain.empty())
        throw InvalidDomain{"variable has empty domain"};
    auto [min_iter, max_iter] = minmax_element(domain.begin(), domain.end());
    if (domain_too_large(*min_iter, *max_iter))
        throw InvalidDomain{"variable values from " + min_iter->to_string() + " to " + max_iter->to_string() +
            " span more than " + to_string(max_domain_size) + " values"};

    auto actual_name = name ? check_name(*name) : to_string(_imp->problem_variables.size());
    auto result = _imp->initial_state.allocate_integer_variable_with_state(domain);
    if (name)
        _imp->initial_state.name_variable(result, actual_name);
    _imp->problem_variables.push_back(result);
    _imp->variable_names.push_back(move(actual_name));
    return result;
}

auto Problem::create_integer_variable_vector(
    size_t how_many,
    Integer lower,
    Integer upper,
    const optional<string> & name) -> vector<IntegerVariableID>
{
    if (lower > upper)
        throw InvalidDomain{"variables have lower bound " + lower.to_string() + " > upper bound " + upper.to_string()};

    vector<IntegerVariableID> result;
    result.reserve(how_many);
    for (size_t n = 0; n < how_many; ++n)
        result.push_back(create_integer_variable(lower, upper, name ? make_optional(*name + "[" + to_string(n) + "]") : nullopt));
    return result;
}

auto Problem::name_of(SimpleIntegerVariableID var) const -> const string &
{
    if (var.index >= _imp->variable_names.size())
        throw UnexpectedException{"variable index " + to_string(var.index) + " is not part of this problem"};
    return _imp->variable_names[var.index];
}

auto Problem::create_state_for_new_search() const -> State
{
    return _imp->initial_state.clone();
}

auto Problem::post(const Constraint & c) -> void
{
    check_not_solving("post a constraint");
    _imp->constraints.push_back(c.clone());
}

auto Problem::create_propagators(State & state) const -> Propagators
{
    Propagators result;
    for (auto & c : _imp->constraints) {
        auto cc = c->clone();
        move(*cc).install(result, state);
    }

    return result;
}

auto Problem::all_normal_variables() const -> const vector<IntegerVariableID> &
{
    return _imp->problem_variables;
}

auto Problem::number_of_constraints() const -> size_t
{
    return _imp->constraints.size();
}

auto Problem::begin_solving() -> void
{
    if (_imp->solving)
        throw UnexpectedException{"this problem is already being solved, and cannot be solved again from inside a callback"};
    _imp->solving = true;
}

auto Problem::end_solving() -> void
{
    _imp->solving = false;
}
