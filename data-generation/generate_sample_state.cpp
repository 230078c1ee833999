#include <queue>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "state.hpp"
#include "generate_sample_state.hpp"

using namespace std;

State shuffle_state(const State& state, int moves, std::mt19937 &rng) {
    if (moves < 0) {
        throw invalid_argument("Number of shuffle moves must be non-negative, got " + to_string(moves));
    }
    State temp_state = state;
    for (int i = 0; i < moves; ++i) {
        auto next = temp_state.get_available_moves();
        std::uniform_int_distribution<size_t> dist(0, next.size() - 1);
        temp_state = next[dist(rng)];
    }
    return temp_state;
}

State random_state_random_walk(int moves, std::mt19937 &rng) {
    return shuffle_state(State::goal(), moves, rng);
}

State random_state_at_depth(int target_depth, std::mt19937 &rng) {
    if (target_depth < 0) {
        throw invalid_argument("Target depth must be non-negative, got " + to_string(target_depth));
    }
    State start_state = State::goal();

    std::queue<std::pair<State, int>> frontier;
    std::unordered_set<State, StateHash> explored;
    frontier.push({start_state, 0});
    explored.insert(start_state);

    std::vector<State> candidates;

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        const State &state = current.first;
        int depth = current.second;

        if (depth > target_depth) break;

        if (depth == target_depth) {
            candidates.push_back(state);
            continue;
        }

        for (const auto &move : state.get_available_moves()) {
            if (explored.insert(move).second) {
                frontier.push({move, depth + 1});
            }
        }
    }

    if (candidates.empty()) {
        // no node found at that depth; return start as fallback
        return start_state;
    }

    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}
