#include <fds/constraints/not_equals.hh>
#include <fds/exception.hh>
#include <fds/problem.hh>
#include <fds/solve.hh>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace fds;

using std::cerr;
using std::cout;
using std::endl;
using std::pair;
using std::size_t;
using std::string;
using std::vector;
using std::chrono::duration;

using fmt::print;

namespace po = boost::program_options;

auto main(int argc, char * argv[]) -> int
{
    po::options_description display_options{"Program options"};
    display_options.add_options()            //
        ("help", "Display help information") //
        ("quiet", "Only print statistics, not every solution");

    po::variables_map options_vars;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(display_options)
                      .run(),
            options_vars);
        po::notify(options_vars);
    }
    catch (const po::error & e) {
        print(cerr, "Error: {}\n", e.what());
        print(cerr, "Try {} --help\n", argv[0]);
        return EXIT_FAILURE;
    }

    if (options_vars.contains("help")) {
        print("Usage: {} [options]\n\n", argv[0]);
        cout << display_options << endl;
        return EXIT_SUCCESS;
    }

    // Australia's mainland states, each with its listed neighbours. Every
    // listed pair gets its own constraint, so each border appears twice.
    vector<pair<string, vector<string>>> mainland_states = {
        {"WA", {"NT", "SA"}},
        {"NT", {"WA", "SA", "Q"}},
        {"SA", {"WA", "NT", "Q", "NSW", "V"}},
        {"Q", {"NT", "SA", "NSW"}},
        {"NSW", {"Q", "SA", "V"}},
        {"V", {"SA", "NSW"}}};

    vector<string> colours = {"Red", "Green", "Blue"};

    Problem p;

    vector<IntegerVariableID> state_colours;
    for (auto & [state, _] : mainland_states)
        state_colours.push_back(p.create_integer_variable(0_i, Integer(colours.size() - 1), state));

    auto index_of = [&](const string & state) -> size_t {
        for (size_t i = 0; i < mainland_states.size(); ++i)
            if (mainland_states[i].first == state)
                return i;
        throw UnexpectedException{"unknown state " + state};
    };

    for (size_t s = 0; s < mainland_states.size(); ++s)
        for (auto & neighbour : mainland_states[s].second)
            p.post(NotEquals{state_colours[s], state_colours[index_of(neighbour)]});

    bool quiet = options_vars.contains("quiet");

    auto stats = solve(p, [&](const Solution & s) -> bool {
        if (! quiet) {
            print("Solution {}, time = {} s\n", s.index(), duration<double>(s.time_since_start()).count());
            for (size_t i = 0; i < mainland_states.size(); ++i)
                print("{}: {}\n", mainland_states[i].first, colours.at(s(state_colours[i]).raw_value));
            print("\n");
        }
        return true;
    });

    print("\nStatistics\n");
    print("  conflicts      : {}\n", stats.conflicts);
    print("  branches       : {}\n", stats.branches);
    print("  wall time      : {} s\n", duration<double>(stats.solve_time).count());
    print("  solutions found: {}\n", stats.solutions);

    return EXIT_SUCCESS;
}
