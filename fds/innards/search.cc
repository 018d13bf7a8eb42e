#include <fds/exception.hh>
#include <fds/innards/propagators.hh>
#include <fds/innards/search.hh>
#include <fds/innards/state.hh>

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

using namespace fds;
using namespace fds::innards;

using std::atomic;
using std::max;
using std::move;
using std::optional;
using std::size_t;
using std::vector;

namespace
{
    struct Frame
    {
        IntegerVariableID variable;
        vector<Integer> values;
        size_t next_value;
        Timestamp timestamp;
    };
}

struct Search::Imp
{
    State & state;
    Propagators & propagators;
    BranchCallback branch;
    TraceCallback trace;
    Stats & stats;
    atomic<bool> * optional_abort_flag;

    vector<Frame> frames{};
    optional<Timestamp> root{};
    SearchStatus status = SearchStatus::Exploring;
    bool at_unexpanded_node = false;

    auto abort_requested() const -> bool
    {
        return optional_abort_flag && optional_abort_flag->load();
    }
};

Search::Search(State & state, Propagators & propagators, BranchCallback branch, TraceCallback trace,
    Stats & stats, atomic<bool> * optional_abort_flag) :
    _imp(new Imp{state, propagators, move(branch), move(trace), stats, optional_abort_flag})
{
    if (! _imp->branch)
        throw UnexpectedException{"search needs a branch callback"};
}

Search::~Search()
{
    if (_imp->root)
        _imp->state.backtrack(*_imp->root);
}

auto Search::depth() const -> unsigned long long
{
    return _imp->frames.size();
}

auto Search::abandon() -> void
{
    _imp->frames.clear();
    if (_imp->root)
        _imp->state.backtrack(*_imp->root);
    _imp->status = SearchStatus::Aborted;
}

auto Search::expand() -> SearchStatus
{
    auto branch = _imp->branch(_imp->state, _imp->propagators);
    if (! branch) {
        if (_imp->propagators.is_consistent(_imp->state)) {
            ++_imp->stats.solutions;
            return SearchStatus::SolutionFound;
        }

        // only possible if a propagator is weaker than its own check
        ++_imp->stats.conflicts;
        return SearchStatus::Exploring;
    }

    if (_imp->trace && ! _imp->trace(_imp->frames.size(), _imp->stats))
        return SearchStatus::Aborted;

    _imp->frames.push_back(Frame{branch->variable, move(branch->values), 0, _imp->state.new_epoch()});
    return SearchStatus::Exploring;
}

auto Search::enter_next_child() -> bool
{
    while (! _imp->frames.empty()) {
        auto & frame = _imp->frames.back();
        _imp->state.backtrack(frame.timestamp);

        while (frame.next_value < frame.values.size()) {
            auto value = frame.values[frame.next_value++];
            ++_imp->stats.branches;
            _imp->state.guess(frame.variable, value);

            if (_imp->propagators.propagate(_imp->state, _imp->optional_abort_flag)) {
                _imp->stats.max_depth = max<unsigned long long>(_imp->stats.max_depth, _imp->frames.size());
                return true;
            }

            ++_imp->stats.conflicts;
            _imp->state.backtrack(frame.timestamp);
        }

        _imp->frames.pop_back();
    }

    return false;
}

auto Search::next() -> SearchStatus
{
    switch (_imp->status) {
    case SearchStatus::Exhausted:
    case SearchStatus::Aborted:
        return _imp->status;
    case SearchStatus::SolutionFound:
    case SearchStatus::Exploring:
        break;
    }

    if (! _imp->root) {
        _imp->root = _imp->state.new_epoch();
        if (! _imp->propagators.propagate(_imp->state, _imp->optional_abort_flag)) {
            _imp->state.backtrack(*_imp->root);
            return _imp->status = SearchStatus::Exhausted;
        }
        _imp->at_unexpanded_node = true;
    }

    while (true) {
        if (_imp->abort_requested()) {
            abandon();
            return _imp->status;
        }

        if (_imp->at_unexpanded_node) {
            _imp->at_unexpanded_node = false;
            switch (expand()) {
            case SearchStatus::SolutionFound:
                return _imp->status = SearchStatus::SolutionFound;
            case SearchStatus::Aborted:
                abandon();
                return _imp->status;
            case SearchStatus::Exploring:
                break;
            case SearchStatus::Exhausted:
                throw NonExhaustiveSwitch{};
            }
        }

        if (! enter_next_child()) {
            _imp->state.backtrack(*_imp->root);
            return _imp->status = SearchStatus::Exhausted;
        }

        _imp->at_unexpanded_node = true;
    }
}
