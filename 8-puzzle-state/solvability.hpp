#ifndef __8_PUZZLE_SOLVABILITY_HPP___
#define __8_PUZZLE_SOLVABILITY_HPP___

/**
 * @file solvability.hpp
 * @brief Inversion-parity test deciding whether a state can reach the goal.
 */

#include "state.hpp"

/**
 * @brief Count inversions among the eight non-blank tiles.
 *
 * Tiles are read in row-major order skipping the blank; an inversion is a
 * pair i < j with value[i] > value[j].
 *
 * @param state State to inspect.
 * @return Number of inversions (0..28).
 */
int count_inversions(const State& state);

/**
 * @brief Decide whether the fixed goal is reachable from `state`.
 *
 * On a 3x3 board a slide never changes the inversion parity, and the goal
 * has zero inversions, so a state is solvable iff its inversion count is even.
 *
 * @param state State to inspect.
 * @return true if the goal is reachable.
 */
bool is_solvable(const State& state);

#endif // __8_PUZZLE_SOLVABILITY_HPP___
