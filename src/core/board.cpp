#include "mrv_sudoku/board.hpp"
#include "mrv_sudoku/domain_tracker.hpp"
#include <stdexcept>

namespace mrv_sudoku {

std::string to_string(Cell cell) {
    return "(" + std::to_string(cell.row) + "," + std::to_string(cell.col) + ")";
}

std::array<Cell, PEER_COUNT> peers(Cell cell) {
    std::array<Cell, PEER_COUNT> result{};
    size_t n = 0;

    for (int c = 0; c < GRID_SIZE; ++c) {
        if (c != cell.col) {
            result[n++] = Cell{cell.row, c};
        }
    }
    for (int r = 0; r < GRID_SIZE; ++r) {
        if (r != cell.row) {
            result[n++] = Cell{r, cell.col};
        }
    }

    // ボックス内で行も列も異なるマス（残り4つ）
    int box_row = (cell.row / BOX_SIZE) * BOX_SIZE;
    int box_col = (cell.col / BOX_SIZE) * BOX_SIZE;
    for (int r = box_row; r < box_row + BOX_SIZE; ++r) {
        for (int c = box_col; c < box_col + BOX_SIZE; ++c) {
            if (r != cell.row && c != cell.col) {
                result[n++] = Cell{r, c};
            }
        }
    }
    return result;
}

Board::Board() = default;

Board Board::from_rows(const std::vector<std::vector<Digit>>& rows) {
    if (rows.size() != GRID_SIZE) {
        throw std::invalid_argument("Board requires 9 rows, got " + std::to_string(rows.size()));
    }

    Board board;
    for (int r = 0; r < GRID_SIZE; ++r) {
        if (rows[r].size() != GRID_SIZE) {
            throw std::invalid_argument("Board row " + std::to_string(r) + " requires 9 values, got " +
                                        std::to_string(rows[r].size()));
        }
        for (int c = 0; c < GRID_SIZE; ++c) {
            Digit v = rows[r][c];
            if (v < 0 || v > 9) {
                throw std::invalid_argument("Board value out of range at " + to_string(Cell{r, c}) +
                                            ": " + std::to_string(v));
            }
            if (v != 0) {
                int idx = Cell{r, c}.index();
                board.values_[idx] = v;
                board.given_[idx] = true;
                --board.empty_count_;
            }
        }
    }
    return board;
}

void Board::assign(Cell cell, Digit value, DomainTracker& tracker) {
    if (!is_empty(cell)) {
        throw std::logic_error("Board::assign() on filled cell " + to_string(cell));
    }
    if (!tracker.domain(*this, cell).contains(value)) {
        throw std::logic_error("Board::assign() value " + std::to_string(value) +
                               " not in domain of " + to_string(cell));
    }

    values_[cell.index()] = value;
    --empty_count_;
    tracker.on_assign(*this, cell, value);
}

void Board::unassign(Cell cell, DomainTracker& tracker) {
    if (is_empty(cell)) {
        throw std::logic_error("Board::unassign() on empty cell " + to_string(cell));
    }
    if (is_given(cell)) {
        throw std::logic_error("Board::unassign() on given cell " + to_string(cell));
    }

    Digit value = values_[cell.index()];
    values_[cell.index()] = 0;
    ++empty_count_;
    tracker.on_unassign(*this, cell, value);
}

DigitSet Board::candidates(Cell cell) const {
    if (!is_empty(cell)) {
        return DigitSet();
    }
    DigitSet result = DigitSet::all();
    for (const auto& p : peers(cell)) {
        Digit v = get(p);
        if (v != 0) {
            result.remove(v);
        }
    }
    return result;
}

int Board::degree(Cell cell) const {
    int count = 0;
    for (const auto& p : peers(cell)) {
        if (is_empty(p)) {
            ++count;
        }
    }
    return count;
}

std::optional<std::pair<Cell, Cell>> Board::find_conflict() const {
    for (int idx = 0; idx < CELL_COUNT; ++idx) {
        Cell cell{idx / GRID_SIZE, idx % GRID_SIZE};
        Digit v = get(cell);
        if (v == 0) {
            continue;
        }
        for (const auto& p : peers(cell)) {
            // 各組を1回だけ見る
            if (p.index() > idx && get(p) == v) {
                return std::make_pair(cell, p);
            }
        }
    }
    return std::nullopt;
}

bool Board::is_valid_solution() const {
    // 全マスが埋まっていれば、ピア間に重複が無いことと
    // 各行・列・ボックスが 1..9 の順列であることは同値
    return is_complete() && !has_conflict();
}

Grid Board::grid() const {
    Grid result{};
    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            result[r][c] = get(Cell{r, c});
        }
    }
    return result;
}

} // namespace mrv_sudoku
