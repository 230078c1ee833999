#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"
#include "state_file_operations.hpp"

State read_state(std::istream& in, const std::string& source) {
    std::vector<int> cells(State::NUM_CELLS);
    for (int i = 0; i < State::NUM_CELLS; ++i) {
        if (!(in >> cells[i])) {
            throw std::runtime_error("Expected 9 cell values in " + source + ", got " + std::to_string(i));
        }
    }
    in >> std::ws;
    if (!in.eof()) {
        throw std::runtime_error("Unexpected trailing data in " + source);
    }
    return State(cells);
}

State read_state_from_file(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    return read_state(infile, filename);
}

void write_state_to_file(const State& state, const std::string& filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    outfile << state.to_string();
    if (!outfile) {
        throw std::runtime_error("Failed writing state to: " + filename);
    }
}
