/**
 * @file board.hpp
 * @brief 9×9 盤面クラス（マス座標、ピア列挙、割り当て/取り消し）
 */
#ifndef MRV_SUDOKU_BOARD_HPP
#define MRV_SUDOKU_BOARD_HPP

#include "mrv_sudoku/digit_set.hpp"
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mrv_sudoku {

class DomainTracker;  // forward declaration

constexpr int GRID_SIZE = 9;
constexpr int BOX_SIZE = 3;
constexpr int CELL_COUNT = GRID_SIZE * GRID_SIZE;
constexpr int PEER_COUNT = 20;

/**
 * @brief マス座標（行, 列）、いずれも 0..8
 */
struct Cell {
    int row;
    int col;

    /**
     * @brief 行優先インデックス（0..80）
     */
    int index() const { return row * GRID_SIZE + col; }

    /**
     * @brief 3×3 ボックス番号（0..8、行優先）
     */
    int box() const { return (row / BOX_SIZE) * BOX_SIZE + col / BOX_SIZE; }

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

/**
 * @brief "(row,col)" 形式の文字列
 */
std::string to_string(Cell cell);

/**
 * @brief マスのピア（同じ行・列・ボックスの他のマス、計20個）を列挙
 *
 * 行 → 列 → ボックスの残りの順。座標のみの純関数。
 */
std::array<Cell, PEER_COUNT> peers(Cell cell);

/**
 * @brief 行ごとの値（0 = 空き）
 */
using Grid = std::array<std::array<Digit, GRID_SIZE>, GRID_SIZE>;

/**
 * @brief 9×9 盤面
 *
 * 初期配置のマス（given）は取り消せない。探索中の変更は assign()/unassign()
 * のみを通し、その都度 DomainTracker に通知する。
 */
class Board {
public:
    /**
     * @brief 全マス空きの盤面を作成
     */
    Board();

    /**
     * @brief 9行×9列の値から盤面を作成
     *
     * 0 以外のマスは given になる。ピア間の矛盾は検査しない（find_conflict() を使う）。
     * @throws std::invalid_argument 形が 9×9 でない、または値が 0..9 の範囲外
     */
    static Board from_rows(const std::vector<std::vector<Digit>>& rows);

    Digit get(Cell cell) const { return values_[cell.index()]; }

    bool is_empty(Cell cell) const { return values_[cell.index()] == 0; }

    bool is_given(Cell cell) const { return given_[cell.index()]; }

    /**
     * @brief 空きマスに値を割り当て、tracker に通知
     * @pre is_empty(cell) かつ value が tracker.domain(*this, cell) に含まれる
     * @throws std::logic_error 事前条件違反（探索エンジンのバグ）
     */
    void assign(Cell cell, Digit value, DomainTracker& tracker);

    /**
     * @brief 探索で割り当てたマスを空きに戻し、tracker に通知
     * @pre マスが埋まっていて given ではない
     * @throws std::logic_error 事前条件違反
     */
    void unassign(Cell cell, DomainTracker& tracker);

    /**
     * @brief ピア除外による定義域 {v : どのピアも v を持たない}
     *
     * 埋まっているマスは空集合を返す。
     */
    DigitSet candidates(Cell cell) const;

    /**
     * @brief 空きのピアの数（Degree）
     */
    int degree(Cell cell) const;

    int empty_count() const { return empty_count_; }

    bool is_complete() const { return empty_count_ == 0; }

    /**
     * @brief 同じ値を持つピアの組を行優先で最初の1つ探す
     */
    std::optional<std::pair<Cell, Cell>> find_conflict() const;

    bool has_conflict() const { return find_conflict().has_value(); }

    /**
     * @brief 全マスが埋まり、全ての行・列・ボックスが 1..9 の順列か
     */
    bool is_valid_solution() const;

    /**
     * @brief 行ごとの値を取得
     */
    Grid grid() const;

    bool operator==(const Board& other) const {
        return values_ == other.values_ && given_ == other.given_;
    }
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    std::array<Digit, CELL_COUNT> values_{};
    std::array<bool, CELL_COUNT> given_{};
    int empty_count_ = CELL_COUNT;
};

} // namespace mrv_sudoku

#endif // MRV_SUDOKU_BOARD_HPP
