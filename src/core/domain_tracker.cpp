#include "mrv_sudoku/domain_tracker.hpp"
#include <initializer_list>

namespace mrv_sudoku {

// ===== ScanningDomainTracker =====

void ScanningDomainTracker::reset(const Board& /*board*/) {}

void ScanningDomainTracker::on_assign(const Board& /*board*/, Cell /*cell*/, Digit /*value*/) {}

void ScanningDomainTracker::on_unassign(const Board& /*board*/, Cell /*cell*/, Digit /*value*/) {}

DigitSet ScanningDomainTracker::domain(const Board& board, Cell cell) const {
    return board.candidates(cell);
}

// ===== CountingDomainTracker =====

CountingDomainTracker::CountingDomainTracker() {
    clear();
}

void CountingDomainTracker::clear() {
    for (auto* counts : {&row_count_, &col_count_, &box_count_}) {
        for (auto& unit : *counts) {
            unit.fill(0);
        }
    }
}

void CountingDomainTracker::reset(const Board& board) {
    clear();
    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            Cell cell{r, c};
            Digit v = board.get(cell);
            if (v != 0) {
                row_count_[cell.row][v]++;
                col_count_[cell.col][v]++;
                box_count_[cell.box()][v]++;
            }
        }
    }
}

void CountingDomainTracker::on_assign(const Board& /*board*/, Cell cell, Digit value) {
    row_count_[cell.row][value]++;
    col_count_[cell.col][value]++;
    box_count_[cell.box()][value]++;
}

void CountingDomainTracker::on_unassign(const Board& /*board*/, Cell cell, Digit value) {
    row_count_[cell.row][value]--;
    col_count_[cell.col][value]--;
    box_count_[cell.box()][value]--;
}

DigitSet CountingDomainTracker::domain(const Board& board, Cell cell) const {
    if (!board.is_empty(cell)) {
        return DigitSet();
    }

    const auto& row = row_count_[cell.row];
    const auto& col = col_count_[cell.col];
    const auto& box = box_count_[cell.box()];

    DigitSet result;
    for (Digit d = 1; d <= 9; ++d) {
        if (row[d] == 0 && col[d] == 0 && box[d] == 0) {
            result.insert(d);
        }
    }
    return result;
}

std::unique_ptr<DomainTracker> make_domain_tracker(DomainStrategy strategy) {
    switch (strategy) {
        case DomainStrategy::Scanning:
            return std::make_unique<ScanningDomainTracker>();
        case DomainStrategy::Counting:
            break;
    }
    return std::make_unique<CountingDomainTracker>();
}

} // namespace mrv_sudoku
