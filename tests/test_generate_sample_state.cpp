// Google Test for the random-walk and exact-depth sample generators
#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

#include "state.hpp"
#include "solvability.hpp"
#include "8-puzzle-bfs-solver.hpp"
#include "generate_sample_state.hpp"

TEST(ShuffleState, ZeroMovesReturnsInput) {
    std::mt19937 rng(1);
    State start(std::vector<int>{1, 2, 3, 4, 5, 6, 7, 0, 8});
    EXPECT_EQ(shuffle_state(start, 0, rng), start);
    EXPECT_EQ(random_state_random_walk(0, rng), State::goal());
}

TEST(ShuffleState, OneMoveIsNeighbor) {
    std::mt19937 rng(2);
    State shuffled = shuffle_state(State::goal(), 1, rng);
    auto moves = State::goal().get_available_moves();
    EXPECT_NE(std::find(moves.begin(), moves.end(), shuffled), moves.end());
}

TEST(ShuffleState, AlwaysSolvable) {
    for (unsigned int seed = 0; seed < 20; ++seed) {
        std::mt19937 rng(seed);
        for (int moves : {0, 1, 2, 7, 20, 30, 100}) {
            EXPECT_TRUE(is_solvable(random_state_random_walk(moves, rng))) << "seed " << seed << " moves " << moves;
        }
    }
}

TEST(ShuffleState, SameSeedSameResult) {
    std::mt19937 a(99);
    std::mt19937 b(99);
    EXPECT_EQ(random_state_random_walk(DEFAULT_SHUFFLE_MOVES, a), random_state_random_walk(DEFAULT_SHUFFLE_MOVES, b));
}

TEST(ShuffleState, NegativeMovesThrows) {
    std::mt19937 rng(0);
    EXPECT_THROW(shuffle_state(State::goal(), -1, rng), std::invalid_argument);
}

TEST(RandomStateAtDepth, HasExactShortestDistance) {
    std::mt19937 rng(17);
    for (int depth : {1, 4, 9, 16}) {
        State s = random_state_at_depth(depth, rng);
        EXPECT_TRUE(is_solvable(s));
        EXPECT_EQ(BFSPuzzleSolver(s, State::goal()).size(), static_cast<size_t>(depth + 1)) << "depth " << depth;
    }
}

TEST(RandomStateAtDepth, BeyondDiameterFallsBackToGoal) {
    std::mt19937 rng(0);
    EXPECT_EQ(random_state_at_depth(0, rng), State::goal());
    EXPECT_EQ(random_state_at_depth(32, rng), State::goal());
    EXPECT_THROW(random_state_at_depth(-1, rng), std::invalid_argument);
}
