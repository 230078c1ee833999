// Google Test for State::get_available_moves
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>
#include <set>
#include <utility>
#include <vector>

#include "state.hpp"

// Goal-ordered tiles with the blank placed at `blank` (row-major index)
static State make_state_with_blank(int blank) {
    std::vector<int> cells;
    int next = 1;
    for (int i = 0; i < State::NUM_CELLS; ++i) {
        cells.push_back(i == blank ? 0 : next++);
    }
    return State(cells);
}

static std::set<int> collect_new_blank_positions(const State& s) {
    std::set<int> result;
    for (const auto &mv : s.get_available_moves()) {
        Position p = mv.get_blank_position();
        result.insert(p.row * State::SIDE_LENGTH + p.column);
    }
    return result;
}

// Number of cells that differ between two states
static int count_differences(const State& a, const State& b) {
    int diff = 0;
    for (int i = 0; i < State::NUM_CELLS; ++i) {
        if (a.get_cells()[i] != b.get_cells()[i]) ++diff;
    }
    return diff;
}

TEST(AvailableMoves, BlankInCorner) {
    State s = make_state_with_blank(8);
    std::set<int> expected = {5, 7};
    EXPECT_EQ(collect_new_blank_positions(s), expected);
}

TEST(AvailableMoves, BlankOnEdge) {
    State s = make_state_with_blank(3);
    // up(0), down(6), right(4)
    std::set<int> expected = {0, 6, 4};
    EXPECT_EQ(collect_new_blank_positions(s), expected);
}

TEST(AvailableMoves, BlankInCenter) {
    State s = make_state_with_blank(4);
    std::set<int> expected = {1, 7, 3, 5};
    EXPECT_EQ(collect_new_blank_positions(s), expected);
}

TEST(AvailableMoves, OrderIsUpDownLeftRight) {
    State s(std::vector<int>{1, 2, 3, 4, 0, 5, 6, 7, 8});
    auto moves = s.get_available_moves();
    ASSERT_EQ(moves.size(), 4u);
    EXPECT_EQ(moves[0], State(std::vector<int>{1, 0, 3, 4, 2, 5, 6, 7, 8}));
    EXPECT_EQ(moves[1], State(std::vector<int>{1, 2, 3, 4, 7, 5, 6, 0, 8}));
    EXPECT_EQ(moves[2], State(std::vector<int>{1, 2, 3, 0, 4, 5, 6, 7, 8}));
    EXPECT_EQ(moves[3], State(std::vector<int>{1, 2, 3, 4, 5, 0, 6, 7, 8}));
}

TEST(AvailableMoves, EverySuccessorIsOneSwapAway) {
    for (int blank = 0; blank < State::NUM_CELLS; ++blank) {
        State s = make_state_with_blank(blank);
        auto moves = s.get_available_moves();
        EXPECT_GE(moves.size(), 2u);
        EXPECT_LE(moves.size(), 4u);
        for (const auto &mv : moves) {
            EXPECT_EQ(count_differences(s, mv), 2);
            Position from = s.get_blank_position();
            Position to = mv.get_blank_position();
            EXPECT_EQ(std::abs(from.row - to.row) + std::abs(from.column - to.column), 1);
            // the tile that moved now sits where the blank was
            EXPECT_EQ(mv.at(from.row, from.column), s.at(to.row, to.column));
        }
    }
}

TEST(AvailableMoves, DoesNotModifySource) {
    State s = make_state_with_blank(4);
    State copy = s;
    s.get_available_moves();
    EXPECT_EQ(s, copy);
}
