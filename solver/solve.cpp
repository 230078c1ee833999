#include <exception>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "state.hpp"
#include "solvability.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"
#include "8-puzzle-solver.hpp"

using namespace std;

static void print_usage() {
    cout << "Usage: solve-8-puzzle [--method BFS|DFS|UCS] [--input-file F | --state \"c0 .. c8\" | --shuffle N]"
            " [--seed S] [--depth-limit L]\n";
}

static void display_path(const vector<State>& path) {
    for (size_t i = 0; i < path.size(); ++i) {
        cout << "Step " << i + 1 << ":\n" << path[i].to_string() << '\n';
    }
}

int main(int argc, char** argv) {
    string method = "BFS";
    string input_file;
    string state_raw;
    int shuffle_moves = DEFAULT_SHUFFLE_MOVES;
    int depth_limit = DFS_DEFAULT_DEPTH_LIMIT;
    unsigned int seed = random_device{}();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--method" && i + 1 < argc) { method = argv[++i]; }
            else if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
            else if (a == "--state" && i + 1 < argc) { state_raw = argv[++i]; }
            else if (a == "--shuffle" && i + 1 < argc) { shuffle_moves = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--depth-limit" && i + 1 < argc) { depth_limit = stoi(argv[++i]); }
            else if (a == "--help") {
                print_usage();
                return 0;
            } else {
                cerr << "Unrecognized argument: " << a << '\n';
                print_usage();
                return 2;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Invalid numeric argument: " << e.what() << '\n';
        return 2;
    }

    if (!input_file.empty() && !state_raw.empty()) {
        cerr << "--input-file and --state are mutually exclusive\n";
        print_usage();
        return 2;
    }

    State start_state;
    try {
        if (!input_file.empty()) {
            start_state = read_state_from_file(input_file);
        } else if (!state_raw.empty()) {
            istringstream in(state_raw);
            try {
                start_state = read_state(in, "--state");
            } catch (const std::exception& e) {
                cerr << "Invalid start state: " << e.what() << '\n';
                return 2;
            }
        } else {
            mt19937 rng(seed);
            start_state = random_state_random_walk(shuffle_moves, rng);
        }
    } catch (const std::invalid_argument& e) {
        cerr << "Invalid start state: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        cerr << "Error loading start state: " << e.what() << '\n';
        return 4;
    }

    cout << "Start:\n" << start_state.to_string() << '\n';

    SolveResult result = solve_puzzle(start_state, State::goal(), method, depth_limit);
    switch (result.status) {
        case SolveStatus::UNSOLVABLE_INPUT:
            cout << "Puzzle is not solvable!\n";
            return 3;
        case SolveStatus::UNKNOWN_STRATEGY:
            cerr << "Unknown method: " << method << '\n';
            return 2;
        case SolveStatus::NOT_FOUND:
            cout << "No solution found (visited nodes: " << result.visited_nodes << ")\n";
            return 1;
        case SolveStatus::SOLVED:
            break;
    }

    display_path(result.path);
    cout << method << ": " << result.path.size() - 1 << " moves, visited nodes: " << result.visited_nodes << '\n';
    return 0;
}
