#include <fds/constraints/all_different.hh>
#include <fds/problem.hh>
#include <fds/solve.hh>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace fds;

using std::cerr;
using std::cout;
using std::endl;
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

    po::options_description all_options{"All options"};
    all_options.add_options() //
        ("size", po::value<int>()->default_value(8), "Size of the board");

    all_options.add(display_options);

    po::positional_options_description positional_options;
    positional_options
        .add("size", -1);

    po::variables_map options_vars;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all_options)
                      .positional(positional_options)
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
        print("Usage: {} [options] [size]\n\n", argv[0]);
        cout << display_options << endl;
        return EXIT_SUCCESS;
    }

    int size = options_vars["size"].as<int>();
    if (size < 1) {
        print(cerr, "Error: size must be at least 1\n");
        return EXIT_FAILURE;
    }

    Problem p;

    // queen[c] is the row of the queen in column c
    auto queens = p.create_integer_variable_vector(size, 0_i, Integer{size - 1}, "queen");

    vector<IntegerVariableID> queens_plus_i, queens_minus_i;
    for (int i = 0; i < size; ++i) {
        queens_plus_i.push_back(queens[i] + Integer{i});
        queens_minus_i.push_back(queens[i] - Integer{i});
    }

    p.post(AllDifferent{queens});
    p.post(AllDifferent{queens_plus_i});
    p.post(AllDifferent{queens_minus_i});

    bool quiet = options_vars.contains("quiet");

    auto stats = solve(p, [&](const Solution & s) -> bool {
        if (! quiet) {
            print("Solution {}, time = {} s\n", s.index(), duration<double>(s.time_since_start()).count());
            for (int row = 0; row < size; ++row) {
                for (int col = 0; col < size; ++col)
                    print("{}", s(queens[col]) == Integer{row} ? "Q " : "_ ");
                print("\n");
            }
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
