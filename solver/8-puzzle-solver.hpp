#ifndef __8_PUZZLE_SOLVER_HPP___
#define __8_PUZZLE_SOLVER_HPP___

/**
 * @file 8-puzzle-solver.hpp
 * @brief Strategy selection front-end over the BFS, DFS and UCS solvers.
 *
 * Every search outcome, including "unsolvable" and "not found", is returned
 * as a `SolveStatus`; nothing is thrown for them.
 */

#include <string>
#include <vector>

#include "state.hpp"
#include "8-puzzle-dfs-solver.hpp"

enum class SearchStrategy {
    BFS,
    DFS,
    UCS
};

enum class SolveStatus {
    SOLVED,
    NOT_FOUND,
    UNSOLVABLE_INPUT,
    UNKNOWN_STRATEGY
};

struct SolveResult {
    SolveStatus status = SolveStatus::NOT_FOUND;
    std::vector<State> path;  // start..goal, empty unless SOLVED
    int visited_nodes = 0;
};

/**
 * @brief Map a strategy name ("BFS", "DFS" or "UCS") to its enum value.
 *
 * @param name Upper-case strategy identifier.
 * @param strategy Receives the parsed value on success.
 * @return false if `name` is not a known strategy.
 */
bool parse_search_strategy(const std::string& name, SearchStrategy& strategy);

const char* search_strategy_name(SearchStrategy strategy);

const char* solve_status_name(SolveStatus status);

/**
 * @brief Check solvability, then run the requested strategy.
 *
 * @param start Starting puzzle state.
 * @param goal Goal puzzle state.
 * @param strategy Search strategy to run.
 * @param depth_limit Depth cap, used by DFS only.
 * @return Outcome, path and number of visited nodes.
 */
SolveResult solve_puzzle(const State& start, const State& goal, SearchStrategy strategy, int depth_limit = DFS_DEFAULT_DEPTH_LIMIT);

/**
 * @brief As above, with the strategy given by name.
 *
 * An unknown name yields `SolveStatus::UNKNOWN_STRATEGY` without searching.
 */
SolveResult solve_puzzle(const State& start, const State& goal, const std::string& method, int depth_limit = DFS_DEFAULT_DEPTH_LIMIT);

#endif // __8_PUZZLE_SOLVER_HPP___
