#include <string>
#include <vector>

#include "state.hpp"
#include "solvability.hpp"
#include "8-puzzle-bfs-solver.hpp"
#include "8-puzzle-dfs-solver.hpp"
#include "8-puzzle-ucs-solver.hpp"
#include "8-puzzle-solver.hpp"

bool parse_search_strategy(const std::string& name, SearchStrategy& strategy) {
    if (name == "BFS") { strategy = SearchStrategy::BFS; return true; }
    if (name == "DFS") { strategy = SearchStrategy::DFS; return true; }
    if (name == "UCS") { strategy = SearchStrategy::UCS; return true; }
    return false;
}

const char* search_strategy_name(SearchStrategy strategy) {
    switch (strategy) {
        case SearchStrategy::BFS: return "BFS";
        case SearchStrategy::DFS: return "DFS";
        case SearchStrategy::UCS: return "UCS";
    }
    return "unknown";
}

const char* solve_status_name(SolveStatus status) {
    switch (status) {
        case SolveStatus::SOLVED: return "solved";
        case SolveStatus::NOT_FOUND: return "not found";
        case SolveStatus::UNSOLVABLE_INPUT: return "unsolvable input";
        case SolveStatus::UNKNOWN_STRATEGY: return "unknown strategy";
    }
    return "unknown";
}

SolveResult solve_puzzle(const State& start, const State& goal, SearchStrategy strategy, int depth_limit) {
    SolveResult result;
    // Slides preserve inversion parity, so start and goal must share it
    if (is_solvable(start) != is_solvable(goal)) {
        result.status = SolveStatus::UNSOLVABLE_INPUT;
        return result;
    }

    switch (strategy) {
        case SearchStrategy::BFS:
            result.path = BFSPuzzleSolver(start, goal, &result.visited_nodes);
            break;
        case SearchStrategy::DFS:
            result.path = DFSPuzzleSolver(start, goal, depth_limit, &result.visited_nodes);
            break;
        case SearchStrategy::UCS:
            result.path = UCSPuzzleSolver(start, goal, &result.visited_nodes);
            break;
    }
    result.status = result.path.empty() ? SolveStatus::NOT_FOUND : SolveStatus::SOLVED;
    return result;
}

SolveResult solve_puzzle(const State& start, const State& goal, const std::string& method, int depth_limit) {
    SearchStrategy strategy;
    if (!parse_search_strategy(method, strategy)) {
        SolveResult result;
        result.status = SolveStatus::UNKNOWN_STRATEGY;
        return result;
    }
    return solve_puzzle(start, goal, strategy, depth_limit);
}
