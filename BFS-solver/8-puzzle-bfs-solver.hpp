#ifndef __8_PUZZLE_BFS_SOLVER_HPP___
#define __8_PUZZLE_BFS_SOLVER_HPP___

#include <vector>

#include "state.hpp"

/**
 * @file 8-puzzle-bfs-solver.hpp
 * @brief Breadth-first search solver for the 8-puzzle `State`.
 */

/**
 * @brief Solve the puzzle using BFS.
 *
 * States are marked visited when discovered, so each state is enqueued at
 * most once. The returned path is a shortest one in number of slides.
 *
 * @param start Starting puzzle state.
 * @param goal Goal puzzle state.
 * @param visited_nodes Optional out-parameter to receive number of visited nodes.
 * @return Sequence of states from start to goal (empty if no solution found).
 */
std::vector<State> BFSPuzzleSolver(const State &start, const State &goal, int* visited_nodes = nullptr);

#endif // __8_PUZZLE_BFS_SOLVER_HPP___
