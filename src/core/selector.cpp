#include "mrv_sudoku/selector.hpp"

namespace mrv_sudoku {

std::optional<Selection> select_next(const Board& board, const DomainTracker& tracker) {
    std::optional<Selection> best;

    // 行優先で走査し、真に良い場合だけ置き換える（同点は先のマスが残る）
    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            Cell cell{r, c};
            if (!board.is_empty(cell)) {
                continue;
            }

            DigitSet domain = tracker.domain(board, cell);
            size_t domain_size = domain.size();
            if (best && domain_size > best->domain.size()) {
                continue;
            }

            int degree = board.degree(cell);
            bool better = false;
            if (!best) {
                better = true;
            } else if (domain_size < best->domain.size()) {
                better = true;
            } else if (degree > best->degree) {
                better = true;
            }

            if (better) {
                best = Selection{cell, domain, degree};
            }
        }
    }

    return best;
}

} // namespace mrv_sudoku
