#include <exception>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "state.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"

using namespace std;

static void print_usage() {
    cout << "Usage: generate-8-puzzle-sample --output-file F [--moves N | --depth D] [--seed S]\n";
}

int main(int argc, char** argv) {
    int moves = DEFAULT_SHUFFLE_MOVES;
    int depth = -1;
    unsigned int seed = random_device{}();
    string output_file;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--moves" && i + 1 < argc) { moves = stoi(argv[++i]); }
            else if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
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
    if (output_file.empty()) {
        cerr << "--output-file is required\n";
        return 2;
    }

    mt19937 rng(seed);
    State sample;
    try {
        sample = depth >= 0 ? random_state_at_depth(depth, rng) : random_state_random_walk(moves, rng);
    } catch (const std::invalid_argument& e) {
        cerr << "Invalid sample parameters: " << e.what() << '\n';
        return 2;
    }
    try {
        write_state_to_file(sample, output_file);
    } catch (const std::exception& e) {
        cerr << "Error generating sample: " << e.what() << '\n';
        return 4;
    }
    return 0;
}
