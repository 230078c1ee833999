#include <algorithm>
#include <stdexcept>
#include <vector>

#include "state.hpp"
#include "path.hpp"

using namespace std;

vector<State> reconstruct_path(const PredecessorMap& came_from, const State& terminal) {
    auto it = came_from.find(terminal);
    if (it == came_from.end()) {
        throw logic_error("reconstruct_path: terminal state has no predecessor entry\n" + terminal.to_string());
    }
    vector<State> path;
    path.push_back(terminal);
    // Bounded by the map size so that a cyclic map cannot loop forever
    while (it != came_from.end()) {
        if (path.size() > came_from.size()) {
            throw logic_error("reconstruct_path: predecessor map contains a cycle");
        }
        path.push_back(it->second);
        it = came_from.find(it->second);
    }
    reverse(path.begin(), path.end());
    return path;
}

bool is_valid_path(const vector<State>& path) {
    for (size_t i = 1; i < path.size(); ++i) {
        auto moves = path[i - 1].get_available_moves();
        if (find(moves.begin(), moves.end(), path[i]) == moves.end()) return false;
    }
    return true;
}
