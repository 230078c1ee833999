#ifndef __8_PUZZLE_SOLVER_API_INTERNAL_HPP___
#define __8_PUZZLE_SOLVER_API_INTERNAL_HPP___

/**
 * @file solver_api_internal.hpp
 * @brief C++ core of `solver_run_instance`, exposed for testing.
 */

#include <functional>

#include "state.hpp"
#include "8-puzzle-solver.hpp"

/**
 * @brief Time `solve` on `start` and translate its outcome to a C API code.
 *
 * Any exception thrown by `solve` is caught and reported as -5.
 *
 * @return Same codes as `solver_run_instance`, -1 and -4 excluded.
 */
int run_timed_instance(
    const State& start_state,
    const std::function<SolveResult(const State&)>& solve,
    double* out_time_ms,
    int* out_steps,
    int* out_visited
);

#endif // __8_PUZZLE_SOLVER_API_INTERNAL_HPP___
