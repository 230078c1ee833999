#ifndef __8_PUZZLE_SOLVER_API_H___
#define __8_PUZZLE_SOLVER_API_H___

/**
 * @file solver_api.h
 * @brief C entry point for driving the solvers from external benchmark harnesses.
 */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Solve the instance stored in `input_file` with the named strategy.
 *
 * @param input_file State file (see state_file_operations.hpp).
 * @param method "BFS", "DFS" or "UCS".
 * @param depth_limit Depth cap for DFS.
 * @param out_time_ms Receives the search time in milliseconds.
 * @param out_steps Receives the number of states on the path (0 if none).
 * @param out_visited Receives the number of visited nodes.
 * @return 1 solved, 0 not found, -1 bad arguments, -2 unsolvable input,
 *         -3 unknown method, -4 unreadable input file, -5 internal error
 *         inside the search. No C++ exception escapes this function.
 */
int solver_run_instance(
    const char* input_file,
    const char* method,
    int depth_limit,
    double* out_time_ms,
    int* out_steps,
    int* out_visited
);

#ifdef __cplusplus
}
#endif

#endif // __8_PUZZLE_SOLVER_API_H___
