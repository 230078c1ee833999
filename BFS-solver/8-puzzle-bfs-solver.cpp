#include <queue>
#include <unordered_set>
#include <vector>
#include "state.hpp"
#include "path.hpp"

#include "8-puzzle-bfs-solver.hpp"

std::vector<State> BFSPuzzleSolver(const State &start, const State &goal, int* visited_nodes) {
    std::vector<State> path;
    std::queue<State> frontier;
    std::unordered_set<State, StateHash> visited;
    PredecessorMap came_from;
    frontier.push(start);
    visited.insert(start);
    if (visited_nodes) {
        *visited_nodes = 0;
    }
    while (!frontier.empty()) {
        State state = frontier.front();
        frontier.pop();
        if (visited_nodes) {
            (*visited_nodes)++;
        }

        if (state == goal) {
            if (state == start) {
                path.push_back(start);
            } else {
                path = reconstruct_path(came_from, state);
            }
            break;
        }

        for (const auto &move : state.get_available_moves()) {
            // Marked on discovery so a state is never enqueued twice
            if (visited.insert(move).second) {
                came_from.emplace(move, state);
                frontier.push(move);
            }
        }
    }
    return path;
}
