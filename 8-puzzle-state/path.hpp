#ifndef __8_PUZZLE_PATH_HPP___
#define __8_PUZZLE_PATH_HPP___

/**
 * @file path.hpp
 * @brief Predecessor bookkeeping shared by the search strategies.
 */

#include <unordered_map>
#include <vector>

#include "state.hpp"

/**
 * @brief Maps each discovered state to the state it was first reached from.
 *
 * The start state has no entry.
 */
typedef std::unordered_map<State, State, StateHash> PredecessorMap;

/**
 * @brief Rebuild the start-to-terminal path from a predecessor map.
 *
 * Follows predecessors from `terminal` until a state with no entry (the start)
 * is reached and returns the visited states in start-to-terminal order.
 *
 * @param came_from Predecessor map filled by a search.
 * @param terminal Last state of the path (usually the goal).
 * @throws std::logic_error if `terminal` has no entry in `came_from`.
 * @return Sequence of states from start to `terminal` (inclusive).
 */
std::vector<State> reconstruct_path(const PredecessorMap& came_from, const State& terminal);

/**
 * @brief Check that every consecutive pair of `path` is one slide apart.
 *
 * @return true for an empty path, a single state, or a chain of legal slides.
 */
bool is_valid_path(const std::vector<State>& path);

#endif // __8_PUZZLE_PATH_HPP___
