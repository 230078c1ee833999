#include <functional>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "state.hpp"
#include "path.hpp"

#include "8-puzzle-ucs-solver.hpp"

namespace {
const int SLIDE_COST = 1;
}

std::vector<State> UCSPuzzleSolver(const State &start, const State &goal, int* visited_nodes) {
    typedef std::pair<int, State> Entry;
    std::vector<State> path;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
    std::unordered_map<State, int, StateHash> cost_so_far;
    std::unordered_set<State, StateHash> explored;
    PredecessorMap came_from;

    frontier.push({0, start});
    cost_so_far[start] = 0;
    if (visited_nodes) {
        *visited_nodes = 0;
    }
    while (!frontier.empty()) {
        Entry current = frontier.top();
        frontier.pop();
        int cost = current.first;
        const State &state = current.second;

        if (explored.count(state)) continue;  // stale entry
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

        explored.insert(state);
        for (const auto &move : state.get_available_moves()) {
            int new_cost = cost + SLIDE_COST;
            auto it = cost_so_far.find(move);
            if (it == cost_so_far.end() || new_cost < it->second) {
                cost_so_far[move] = new_cost;
                frontier.push({new_cost, move});
                came_from.insert_or_assign(move, state);
            }
        }
    }
    return path;
}
