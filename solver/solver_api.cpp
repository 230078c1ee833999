#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <vector>
#include "state.hpp"
#include "state_file_operations.hpp"
#include "8-puzzle-solver.hpp"
#include "solver_api.h"
#include "solver_api_internal.hpp"

int run_timed_instance(
    const State& start_state,
    const std::function<SolveResult(const State&)>& solve,
    double* out_time_ms,
    int* out_steps,
    int* out_visited
) {
    auto t0 = std::chrono::steady_clock::now();
    SolveResult result;
    try {
        result = solve(start_state);
    } catch (const std::exception&) {
        *out_time_ms = 0.0;
        *out_steps = 0;
        *out_visited = 0;
        return -5;
    }
    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();

    *out_time_ms = ms;
    *out_steps = static_cast<int>(result.path.size());
    *out_visited = result.visited_nodes;
    switch (result.status) {
        case SolveStatus::SOLVED: return 1;
        case SolveStatus::NOT_FOUND: return 0;
        case SolveStatus::UNSOLVABLE_INPUT: return -2;
        case SolveStatus::UNKNOWN_STRATEGY: return -3;
    }
    return 0;
}

extern "C" {
    int solver_run_instance(
        const char* input_file,
        const char* method,
        int depth_limit,
        double* out_time_ms,
        int* out_steps,
        int* out_visited
    ) {
        if (!input_file || !method || !out_time_ms || !out_steps || !out_visited) {
            return -1;
        }
        try {
            State start_state;
            try {
                start_state = read_state_from_file(std::string(input_file));
            } catch (const std::exception&) {
                return -4;
            }
            const std::string strategy(method);
            return run_timed_instance(
                start_state,
                [&strategy, depth_limit](const State& start) {
                    return solve_puzzle(start, State::goal(), strategy, depth_limit);
                },
                out_time_ms, out_steps, out_visited);
        } catch (const std::exception&) {
            // std::string or std::function allocation failures
            return -5;
        }
    }
}
