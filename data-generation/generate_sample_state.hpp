#ifndef __8_PUZZLE_GENERATE_SAMPLE_STATE_HPP___
#define __8_PUZZLE_GENERATE_SAMPLE_STATE_HPP___

#include <random>

#include "state.hpp"

/**
 * @file generate_sample_state.hpp
 * @brief Utilities to create random solvable puzzle states for the solvers and tests.
 *
 * Two sampling strategies are provided:
 * - random walk: perform a number of random legal slides from a given state
 * - BFS sampling: collect all states at exact distance from the goal and pick one uniformly
 *
 * Both only ever follow legal slides from the goal, so their results are solvable.
 */

const int DEFAULT_SHUFFLE_MOVES = 30;

/**
 * @brief Apply `moves` uniformly-random legal slides to `state`.
 *
 * A slide may undo the previous one, so the result can lie fewer than `moves`
 * slides away from `state`.
 *
 * @param state State to start the walk from.
 * @param moves Number of random slides to perform (0 returns `state`).
 * @param rng Random number generator to use (std::mt19937).
 * @throws std::invalid_argument if `moves` is negative.
 * @return The final state of the walk.
 */
State shuffle_state(const State& state, int moves, std::mt19937 &rng);

/**
 * @brief Generate a random state by performing a random walk from the goal state.
 *
 * @param moves Number of random slides to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled, solvable `State`.
 */
State random_state_random_walk(int moves, std::mt19937 &rng);

/**
 * @brief Generate a random state by uniform sampling among states at exact BFS depth.
 *
 * The function performs a breadth-first search from the goal state up to
 * `target_depth` and uniformly selects one of the states at that depth, whose
 * shortest solution is therefore exactly `target_depth` slides long.
 *
 * @param target_depth Distance from the goal to sample at.
 * @param rng Random number generator to use (std::mt19937).
 * @throws std::invalid_argument if `target_depth` is negative.
 * @return A sampled `State`. Returns the goal state if no state exists at that depth.
 */
State random_state_at_depth(int target_depth, std::mt19937 &rng);

#endif // __8_PUZZLE_GENERATE_SAMPLE_STATE_HPP___
