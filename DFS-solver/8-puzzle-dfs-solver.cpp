#include <stack>
#include <tuple>
#include <utility>
#include <unordered_set>
#include <vector>
#include "state.hpp"

#include "8-puzzle-dfs-solver.hpp"

std::vector<State> DFSPuzzleSolver(const State &start, const State &goal, int depth_limit, int* visited_nodes) {
    // (state, path taken to reach it, depth)
    std::stack<std::tuple<State, std::vector<State>, int>> frontier;
    std::unordered_set<State, StateHash> visited;
    frontier.push(std::make_tuple(start, std::vector<State>(), 0));
    if (visited_nodes) {
        *visited_nodes = 0;
    }
    while (!frontier.empty()) {
        State state = std::get<0>(frontier.top());
        std::vector<State> current_path = std::move(std::get<1>(frontier.top()));
        int depth = std::get<2>(frontier.top());
        frontier.pop();

        if (depth > depth_limit) continue;
        if (!visited.insert(state).second) continue;
        if (visited_nodes) {
            (*visited_nodes)++;
        }

        current_path.push_back(state);
        if (state == goal) {
            return current_path;
        }

        auto moves = state.get_available_moves();
        // Reverse order so the first move is popped first
        for (auto it = moves.rbegin(); it != moves.rend(); ++it) {
            if (visited.find(*it) == visited.end()) {
                frontier.push(std::make_tuple(*it, current_path, depth + 1));
            }
        }
    }
    return {};
}
