#include <chrono>
#include <exception>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"
#include "8-puzzle-solver.hpp"

using namespace std;

static void print_usage() {
    cout << "Usage: benchmark-8-puzzle [--methods BFS,DFS,UCS] [--depth D] [--instances K]"
            " [--depth-limit L] [--input-file F] [--seed S]\n";
}

int main(int argc, char** argv) {
    int depth = 20;
    int depth_limit = DFS_DEFAULT_DEPTH_LIMIT;
    int instances = 1;
    string methods_raw = "BFS,DFS,UCS";
    string input_file;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--depth-limit" && i + 1 < argc) { depth_limit = stoi(argv[++i]); }
            else if (a == "--instances" && i + 1 < argc) { instances = stoi(argv[++i]); }
            else if (a == "--methods" && i + 1 < argc) { methods_raw = argv[++i]; }
            else if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
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

    if (instances < 1) {
        cerr << "--instances must be at least 1\n";
        return 2;
    }

    vector<SearchStrategy> strategies;
    std::stringstream ss(methods_raw);
    std::string token;
    while (getline(ss, token, ',')) {
        SearchStrategy strategy;
        if (!parse_search_strategy(token, strategy)) {
            cerr << "Unknown method: " << token << '\n';
            return 2;
        }
        strategies.push_back(strategy);
    }

    mt19937 rng(seed);
    vector<State> starts;
    try {
        if (!input_file.empty()) {
            starts.push_back(read_state_from_file(input_file));
        } else {
            for (int i = 0; i < instances; ++i) starts.push_back(random_state_at_depth(depth, rng));
        }
    } catch (const std::invalid_argument& e) {
        cerr << "Invalid instance parameters: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        cerr << "Error preparing instances: " << e.what() << '\n';
        return 4;
    }

    // CSV header
    cout << "instance_id,seed,method,time_ms,found,path_length,visited_nodes" << '\n';

    const State goal_state = State::goal();
    for (size_t id = 0; id < starts.size(); ++id) {
        for (SearchStrategy strategy : strategies) {
            auto t0 = chrono::steady_clock::now();
            SolveResult result = solve_puzzle(starts[id], goal_state, strategy, depth_limit);
            auto t1 = chrono::steady_clock::now();
            double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

            if (result.status == SolveStatus::UNSOLVABLE_INPUT) {
                cerr << "Instance " << id << " is not solvable\n";
                return 3;
            }
            bool found = result.status == SolveStatus::SOLVED;
            size_t moves = found ? result.path.size() - 1 : 0;
            cout << id << ',' << seed << ',' << search_strategy_name(strategy) << ',' << ms << ','
                 << (found?1:0) << ',' << moves << ',' << result.visited_nodes << '\n';
        }
    }

    return 0;
}
