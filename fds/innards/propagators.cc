#include <fds/exception.hh>
#include <fds/innards/propagators.hh>
#include <fds/innards/variable_id_utils.hh>

#include <deque>
#include <utility>

using namespace fds;
using namespace fds::innards;

using std::atomic;
using std::deque;
using std::move;
using std::string;
using std::vector;

auto fds::innards::propagation_result_from(Inference inf) -> PropagationResult
{
    switch (inf) {
    case Inference::NoChange: return PropagationResult::Unchanged;
    case Inference::DomainChanged:
    case Inference::Instantiated: return PropagationResult::Reduced;
    case Inference::Contradiction: return PropagationResult::Contradiction;
    }
    throw NonExhaustiveSwitch{};
}

auto fds::innards::increase_result_to(PropagationResult & current, PropagationResult other) -> void
{
    if (other == PropagationResult::Contradiction || (other == PropagationResult::Reduced && current == PropagationResult::Unchanged))
        current = other;
}

struct Propagators::Imp
{
    vector<PropagationFunction> propagation_functions;
    vector<ConsistencyFunction> consistency_functions;
    vector<string> names;

    // Every propagator is either in the queue exactly once, with in_queue set,
    // or is not in the queue. Propagators are run in the order they arrive.
    deque<int> queue;
    vector<bool> in_queue;
    bool first_propagation = true;

    vector<vector<int>> triggers;
    string last_contradiction = "";

    unsigned long long total_propagations = 0, effectful_propagations = 0, contradicting_propagations = 0;
};

Propagators::Propagators() :
    _imp(new Imp())
{
}

Propagators::~Propagators() = default;

Propagators::Propagators(Propagators &&) = default;

auto Propagators::operator=(Propagators &&) -> Propagators & = default;

auto Propagators::install(PropagationFunction && f, ConsistencyFunction && c, const Triggers & triggers, const string & name) -> void
{
    int id = _imp->propagation_functions.size();
    _imp->propagation_functions.emplace_back(move(f));
    _imp->consistency_functions.emplace_back(move(c));
    _imp->names.push_back(name);
    _imp->in_queue.push_back(false);

    for (const auto & v : triggers.on_change) {
        auto index = deview(v).first.index;
        if (_imp->triggers.size() <= index)
            _imp->triggers.resize(index + 1);
        auto & trigger_list = _imp->triggers[index];
        if (trigger_list.empty() || trigger_list.back() != id)
            trigger_list.push_back(id);
    }
}

auto Propagators::model_contradiction(const string & explain_yourself) -> void
{
    install([](State &) -> PropagationResult { return PropagationResult::Contradiction; },
        [](const State &) -> bool { return false; },
        Triggers{}, "model contradiction: " + explain_yourself);
}

auto Propagators::enqueue(int id) -> void
{
    if (! _imp->in_queue[id]) {
        _imp->in_queue[id] = true;
        _imp->queue.push_back(id);
    }
}

auto Propagators::propagate(State & state, atomic<bool> * optional_abort_flag) -> bool
{
    if (_imp->first_propagation) {
        _imp->first_propagation = false;
        for (int id = 0, id_end = _imp->propagation_functions.size(); id != id_end; ++id)
            enqueue(id);
    }

    auto enqueue_changed = [&]() {
        state.extract_changed_variables([&](SimpleIntegerVariableID var) {
            if (var.index < _imp->triggers.size())
                for (auto & id : _imp->triggers[var.index])
                    enqueue(id);
        });
    };

    enqueue_changed();

    while (! _imp->queue.empty()) {
        if (optional_abort_flag && optional_abort_flag->load())
            break;

        int id = _imp->queue.front();
        _imp->queue.pop_front();
        _imp->in_queue[id] = false;

        ++_imp->total_propagations;
        switch (_imp->propagation_functions[id](state)) {
        case PropagationResult::Unchanged:
            break;

        case PropagationResult::Reduced:
            ++_imp->effectful_propagations;
            enqueue_changed();
            break;

        case PropagationResult::Contradiction:
            ++_imp->contradicting_propagations;
            _imp->last_contradiction = _imp->names[id];
            for (auto & q : _imp->queue)
                _imp->in_queue[q] = false;
            _imp->queue.clear();
            state.extract_changed_variables([](SimpleIntegerVariableID) {});
            return false;
        }
    }

    return true;
}

auto Propagators::is_consistent(const State & state) const -> bool
{
    for (auto & f : _imp->consistency_functions)
        if (! f(state))
            return false;
    return true;
}

auto Propagators::fill_in_constraint_stats(Stats & stats) const -> void
{
    stats.n_propagators += _imp->propagation_functions.size();
    stats.propagations += _imp->total_propagations;
    stats.effectful_propagations += _imp->effectful_propagations;
}

auto Propagators::degree_of(const IntegerVariableID & var) const -> long
{
    auto index = deview(var).first.index;
    return index < _imp->triggers.size() ? _imp->triggers[index].size() : 0;
}

auto Propagators::number_of_propagators() const -> unsigned long long
{
    return _imp->propagation_functions.size();
}

auto Propagators::name_of_last_contradiction() const -> const string &
{
    return _imp->last_contradiction;
}
