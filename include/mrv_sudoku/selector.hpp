/**
 * @file selector.hpp
 * @brief 次に分岐するマスの選択（MRV → Degree → 行優先）
 */
#ifndef MRV_SUDOKU_SELECTOR_HPP
#define MRV_SUDOKU_SELECTOR_HPP

#include "mrv_sudoku/board.hpp"
#include "mrv_sudoku/domain_tracker.hpp"
#include <optional>

namespace mrv_sudoku {

/**
 * @brief 選択結果（選択時点の定義域と Degree を含む）
 */
struct Selection {
    Cell cell;
    DigitSet domain;
    int degree;
};

/**
 * @brief 次に分岐するマスを選択
 *
 * 空きマスのうち定義域が最小のもの（MRV）。同数なら Degree が最大のもの、
 * それでも同じなら行優先で最初のもの。盤面と定義域だけで決まる。
 *
 * @return 空きマスが無ければ std::nullopt
 */
std::optional<Selection> select_next(const Board& board, const DomainTracker& tracker);

} // namespace mrv_sudoku

#endif // MRV_SUDOKU_SELECTOR_HPP
