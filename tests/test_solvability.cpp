// Google Test for inversion counting and the solvability check
#include <gtest/gtest.h>
#include <random>
#include <utility>
#include <vector>

#include "state.hpp"
#include "solvability.hpp"
#include "generate_sample_state.hpp"

TEST(Solvability, GoalIsSolvable) {
    EXPECT_EQ(count_inversions(State::goal()), 0);
    EXPECT_TRUE(is_solvable(State::goal()));
}

TEST(Solvability, OneSlideFromGoal) {
    State s(std::vector<std::vector<int>>{{1, 2, 3}, {4, 5, 6}, {7, 0, 8}});
    EXPECT_TRUE(is_solvable(s));
}

TEST(Solvability, SwappedTilesAreUnsolvable) {
    State s(std::vector<std::vector<int>>{{1, 2, 3}, {4, 5, 6}, {8, 7, 0}});
    EXPECT_EQ(count_inversions(s), 1);
    EXPECT_FALSE(is_solvable(s));
}

TEST(Solvability, BlankIsIgnored) {
    // 8 6 7 / 2 5 4 / 3 _ 1 has 24 inversions
    State s(std::vector<int>{8, 6, 7, 2, 5, 4, 3, 0, 1});
    EXPECT_EQ(count_inversions(s), 24);
    EXPECT_TRUE(is_solvable(s));

    State reversed(std::vector<int>{8, 7, 6, 5, 4, 3, 2, 1, 0});
    EXPECT_EQ(count_inversions(reversed), 28);
}

TEST(Solvability, ParityPreservedBySlides) {
    std::mt19937 rng(7);
    for (int i = 0; i < 50; ++i) {
        State solvable = random_state_random_walk(i, rng);
        // swapping two non-blank tiles flips the parity
        std::vector<int> cells(solvable.get_cells().begin(), solvable.get_cells().end());
        int a = cells[0] == 0 ? 1 : 0;
        int b = (cells[a + 1] == 0) ? a + 2 : a + 1;
        std::swap(cells[a], cells[b]);
        State unsolvable(cells);
        ASSERT_NE(is_solvable(solvable), is_solvable(unsolvable));

        for (const State &g : {solvable, unsolvable}) {
            for (const auto &neighbor : g.get_available_moves()) {
                EXPECT_EQ(is_solvable(g), is_solvable(neighbor));
            }
        }
    }
}
