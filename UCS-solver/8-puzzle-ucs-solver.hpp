#ifndef __8_PUZZLE_UCS_SOLVER_HPP___
#define __8_PUZZLE_UCS_SOLVER_HPP___

#include <vector>

#include "state.hpp"

/**
 * @file 8-puzzle-ucs-solver.hpp
 * @brief Uniform-cost search solver for the 8-puzzle `State`.
 */

/**
 * @brief Solve the puzzle using uniform-cost search (every slide costs 1).
 *
 * Entries with equal cost are popped in `State` order. Stale queue entries
 * for already expanded states are skipped.
 *
 * @param start Starting puzzle state.
 * @param goal Goal puzzle state.
 * @param visited_nodes Optional out-parameter to receive number of visited nodes.
 * @return Sequence of states from start to goal (empty if no solution found).
 */
std::vector<State> UCSPuzzleSolver(const State &start, const State &goal, int* visited_nodes = nullptr);

#endif // __8_PUZZLE_UCS_SOLVER_HPP___
