/**
 * @file move_recorder.hpp
 * @brief 探索中の最初の4手の記録
 */
#ifndef MRV_SUDOKU_MOVE_RECORDER_HPP
#define MRV_SUDOKU_MOVE_RECORDER_HPP

#include "mrv_sudoku/board.hpp"
#include <cstddef>
#include <vector>

namespace mrv_sudoku {

/**
 * @brief 1手分の記録
 */
struct MoveRecord {
    size_t order;        // 何番目の割り当てか（1始まり）
    Cell cell;
    size_t domain_size;  // 選択時点の定義域サイズ
    int degree;          // 選択時点の Degree
    Digit value;
};

/**
 * @brief 時系列で最初の CAPACITY 手を記録する
 *
 * バックトラックで取り消された手も残る（最終解の手順ではなく、試した順）。
 */
class MoveRecorder {
public:
    static constexpr size_t CAPACITY = 4;

    /**
     * @brief 手を記録
     * @return 記録されたら true、既に CAPACITY 件あれば何もせず false
     */
    bool record(size_t order, Cell cell, size_t domain_size, int degree, Digit value);

    bool full() const { return moves_.size() >= CAPACITY; }

    size_t size() const { return moves_.size(); }

    const std::vector<MoveRecord>& moves() const { return moves_; }

private:
    std::vector<MoveRecord> moves_;
};

} // namespace mrv_sudoku

#endif // MRV_SUDOKU_MOVE_RECORDER_HPP
