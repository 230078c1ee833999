#include <vector>

#include "state.hpp"
#include "solvability.hpp"

using namespace std;

int count_inversions(const State& state) {
    vector<int> tiles;
    tiles.reserve(State::NUM_CELLS - 1);
    for (int v : state.get_cells()) {
        if (v != State::BLANK) tiles.push_back(v);
    }
    int inversions = 0;
    for (size_t i = 0; i < tiles.size(); ++i) {
        for (size_t j = i + 1; j < tiles.size(); ++j) {
            if (tiles[i] > tiles[j]) ++inversions;
        }
    }
    return inversions;
}

bool is_solvable(const State& state) {
    return count_inversions(state) % 2 == 0;
}
