#ifndef __8_PUZZLE_DFS_SOLVER_HPP___
#define __8_PUZZLE_DFS_SOLVER_HPP___

#include <vector>

#include "state.hpp"

/**
 * @file 8-puzzle-dfs-solver.hpp
 * @brief Depth-limited depth-first search solver for the 8-puzzle `State`.
 */

const int DFS_DEFAULT_DEPTH_LIMIT = 50;

/**
 * @brief Solve the puzzle using depth-limited DFS with an explicit stack.
 *
 * Each stack entry carries its own path. A state is marked visited when it is
 * popped, not when it is pushed, so the same state may sit on the stack more
 * than once; entries deeper than `depth_limit` are dropped unexpanded. The
 * returned path is not necessarily the shortest.
 *
 * @param start Starting puzzle state.
 * @param goal Goal puzzle state.
 * @param depth_limit Maximum number of slides from `start` (0 only matches start itself).
 * @param visited_nodes Optional out-parameter to receive number of visited nodes.
 * @return Sequence of states from start to goal (empty if no solution found
 *         within the depth limit).
 */
std::vector<State> DFSPuzzleSolver(const State &start, const State &goal, int depth_limit = DFS_DEFAULT_DEPTH_LIMIT, int* visited_nodes = nullptr);

#endif // __8_PUZZLE_DFS_SOLVER_HPP___
