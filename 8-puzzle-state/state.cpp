#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"

using namespace std;

void State::init(const vector<int>& values) {
    if (values.size() != static_cast<size_t>(NUM_CELLS)) {
        throw invalid_argument("State requires exactly 9 cells, got " + std::to_string(values.size()));
    }
    for (int i = 0; i < NUM_CELLS; ++i) {
        if (values[i] < 0 || values[i] >= NUM_CELLS) {
            throw invalid_argument("Cell values must be in range [0,8]");
        }
        for (int j = 0; j < i; ++j) {
            if (values[j] == values[i]) {
                throw invalid_argument("Duplicate cell value " + std::to_string(values[i]));
            }
        }
    }
    copy(values.begin(), values.end(), this->cells.begin());
}

State::State() {
    for (int i = 0; i < NUM_CELLS - 1; ++i) cells[i] = i + 1;
    cells[NUM_CELLS - 1] = BLANK;
}

State::State(const vector<int>& cells) {
    init(cells);
}

State::State(const vector<vector<int>>& rows) {
    if (rows.size() != static_cast<size_t>(SIDE_LENGTH)) {
        throw invalid_argument("State requires exactly 3 rows");
    }
    vector<int> flat;
    flat.reserve(NUM_CELLS);
    for (const auto &row : rows) {
        if (row.size() != static_cast<size_t>(SIDE_LENGTH)) {
            throw invalid_argument("Each row must hold exactly 3 cells");
        }
        flat.insert(flat.end(), row.begin(), row.end());
    }
    init(flat);
}

State State::goal() {
    return State();
}

size_t State::hash() const {
    // FNV-1a over the cell values
    size_t h = 1469598103934665603ULL; // FNV offset
    for (int v : cells) {
        h ^= static_cast<size_t>(v + 1);
        h *= 1099511628211ULL; // FNV prime
    }
    return h;
}

int State::at(int row, int column) const {
    if (row < 0 || row >= SIDE_LENGTH || column < 0 || column >= SIDE_LENGTH) {
        throw out_of_range("Cell coordinates must be in range [0,2]");
    }
    return cells[row * SIDE_LENGTH + column];
}

const array<int, State::NUM_CELLS>& State::get_cells() const {
    return cells;
}

Position State::get_blank_position() const {
    int index = static_cast<int>(find(cells.begin(), cells.end(), BLANK) - cells.begin());
    return Position{index / SIDE_LENGTH, index % SIDE_LENGTH};
}

vector<State> State::get_available_moves() const {
    vector<State> moves;
    moves.reserve(4);
    Position blank = get_blank_position();
    // Up, down, left, right
    static const int directions[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
    for (const auto &dir : directions) {
        int row = blank.row + dir[0];
        int column = blank.column + dir[1];
        if (row < 0 || row >= SIDE_LENGTH || column < 0 || column >= SIDE_LENGTH) continue;
        State next = *this;
        swap(next.cells[blank.row * SIDE_LENGTH + blank.column], next.cells[row * SIDE_LENGTH + column]);
        moves.push_back(next);
    }
    return moves;
}

string State::to_string() const {
    ostringstream out;
    for (int row = 0; row < SIDE_LENGTH; ++row) {
        for (int column = 0; column < SIDE_LENGTH; ++column) {
            if (column) out << ' ';
            out << cells[row * SIDE_LENGTH + column];
        }
        out << '\n';
    }
    return out.str();
}

bool State::operator==(const State &rhs) const {
    return cells == rhs.cells;
}

bool State::operator!=(const State &rhs) const {
    return !(*this == rhs);
}

bool State::operator<(const State &rhs) const {
    return cells < rhs.cells;
}
