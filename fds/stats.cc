/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <fds/stats.hh>

#include <ostream>

using namespace fds;

using std::ostream;

auto fds::operator<<(ostream & o, const Stats & s) -> ostream &
{
    o << "propagators: " << s.n_propagators << '\n';
    o << "branches: " << s.branches << '\n';
    o << "conflicts: " << s.conflicts << '\n';
    o << "propagations: " << s.propagations << '\n';
    o << "effectful propagations: " << s.effectful_propagations << '\n';
    o << "max depth: " << s.max_depth << '\n';
    o << "solutions: " << s.solutions << '\n';
    o << "solve time: " << (s.solve_time.count() / 1'000'000.0) << "s" << '\n';
    if (! s.completed)
        o << "search did not complete" << '\n';
    return o;
}
