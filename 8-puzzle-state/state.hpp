/**
 * @file state.hpp
 * @brief 8-puzzle state representation (3x3 cells with a single blank).
 *
 * This header declares the State class used across solvers and tools.
 */

#ifndef __8_PUZZLE_STATE_HPP___
#define __8_PUZZLE_STATE_HPP___

#include <array>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Row/column coordinate of a cell on the board (both in [0, 2]).
 */
struct Position {
    int row;
    int column;

    bool operator==(const Position &rhs) const { return row == rhs.row && column == rhs.column; }
};

/**
 * @brief Represents an 8-puzzle board configuration.
 *
 * The class stores the nine cell values in row-major order; 0 marks the blank.
 * Instances are immutable once constructed, so they can be used directly as
 * keys of ordered and unordered containers.
 */
class State {

public:
    static constexpr int SIDE_LENGTH = 3;
    static constexpr int NUM_CELLS = SIDE_LENGTH * SIDE_LENGTH;
    static constexpr int BLANK = 0;

private:
    std::array<int, NUM_CELLS> cells;
    void init(const std::vector<int>& cells);
public:
    /**
     * @brief Construct the goal state.
     */
    State();

    /**
     * @brief Construct a State from cell values in row-major order.
     *
     * @param cells Nine values forming a permutation of 0..8 (0 = blank).
     * @throws std::invalid_argument on inconsistent input.
     */
    explicit State(const std::vector<int>& cells);

    /**
     * @brief Construct a State from three rows of three values.
     *
     * @param rows Rows of the board, top to bottom.
     * @throws std::invalid_argument on inconsistent input.
     */
    explicit State(const std::vector<std::vector<int>>& rows);
    ~State() = default;

    // Rule of five
    State(const State& other) = default;
    State& operator=(const State& other) = default;
    State(State&& other) = default;
    State& operator=(State&& other) = default;

    /**
     * @brief The fixed goal configuration: rows (1,2,3), (4,5,6), (7,8,0).
     */
    static State goal();

    /**
     * @brief Compute a stable hash for this state.
     *
     * The hash is suitable for use in unordered containers.
     * @return A size_t hash value.
     */
    size_t hash() const;

    /**
     * @brief Value of the cell at the given row and column.
     *
     * @throws std::out_of_range if row or column is outside [0, 2].
     */
    int at(int row, int column) const;

    const std::array<int, NUM_CELLS>& get_cells() const;

    /**
     * @brief Locate the blank cell.
     * @return Row and column of the blank.
     */
    Position get_blank_position() const;

    /**
     * @brief Generate all legal successor states from this state.
     *
     * The blank is moved up, down, left and right, in that order; directions
     * leaving the board are skipped, so 2 to 4 successors are returned.
     * Depth-first traversal order relies on this order.
     *
     * @return Vector of successor `State` instances.
     */
    std::vector<State> get_available_moves() const;

    /**
     * @brief Render the board as three lines of space separated values.
     */
    std::string to_string() const;

    /**
     * @brief Equality comparison between two states (same value in every cell).
     */
    bool operator==(const State &rhs) const;
    bool operator!=(const State &rhs) const;

    /**
     * @brief Strict weak ordering used for ordered containers (std::set) and
     * priority queues: lexicographic over the row-major cells.
     */
    bool operator<(const State &rhs) const;
};

/**
 * @brief Hash functor for unordered containers keyed by `State`.
 */
struct StateHash {
    size_t operator()(const State &s) const { return s.hash(); }
};

#endif // __8_PUZZLE_STATE_HPP___
