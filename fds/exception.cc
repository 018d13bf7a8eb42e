#include <fds/exception.hh>

using namespace fds;

using std::source_location;
using std::string;
using std::to_string;

UnexpectedException::UnexpectedException(const string & w) :
    _wat("unexpected problem: " + w)
{
}

auto UnexpectedException::what() const noexcept -> const char *
{
    return _wat.c_str();
}

NonExhaustiveSwitch::NonExhaustiveSwitch(const source_location & where) :
    UnexpectedException{"non-exhaustive at " + string{where.file_name()} + ":" + to_string(where.line()) +
        " in " + string{where.function_name()}}
{
}

InvalidDomain::InvalidDomain(const string & w) :
    _wat("invalid domain: " + w)
{
}

auto InvalidDomain::what() const noexcept -> const char *
{
    return _wat.c_str();
}

ValueOutOfDomain::ValueOutOfDomain(const string & variable, Integer value) :
    UnexpectedException{"tried to assign value " + value.to_string() + " to " + variable +
        " but it is not in the current domain"}
{
}

CallbackFailure::CallbackFailure(const string & w, const Stats & s) :
    _wat("solution callback failed: " + w),
    _partial_stats(s)
{
    _partial_stats.completed = false;
}

auto CallbackFailure::what() const noexcept -> const char *
{
    return _wat.c_str();
}

auto CallbackFailure::partial_stats() const -> const Stats &
{
    return _partial_stats;
}
