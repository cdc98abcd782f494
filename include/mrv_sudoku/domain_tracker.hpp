/**
 * @file domain_tracker.hpp
 * @brief 空きマスの定義域管理（走査方式 / 計数方式）
 */
#ifndef MRV_SUDOKU_DOMAIN_TRACKER_HPP
#define MRV_SUDOKU_DOMAIN_TRACKER_HPP

#include "mrv_sudoku/board.hpp"
#include "mrv_sudoku/digit_set.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace mrv_sudoku {

/**
 * @brief 定義域の更新方式
 */
enum class DomainStrategy {
    Counting,  // 行/列/ボックス × 数字 の出現数を差分更新
    Scanning   // 問い合わせごとに20ピアを走査
};

/**
 * @brief 定義域管理の基底クラス
 *
 * どの実装でも、reset() 後に Board::assign()/unassign() 経由の変更だけを
 * 受けている限り、domain(board, cell) は board.candidates(cell) と一致する。
 */
class DomainTracker {
public:
    virtual ~DomainTracker() = default;

    /**
     * @brief 実装名を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief 盤面から内部状態を作り直す（探索開始時）
     */
    virtual void reset(const Board& board) = 0;

    /**
     * @brief cell に value が割り当てられた後に呼ばれる
     */
    virtual void on_assign(const Board& board, Cell cell, Digit value) = 0;

    /**
     * @brief cell から value が取り消された後に呼ばれる
     */
    virtual void on_unassign(const Board& board, Cell cell, Digit value) = 0;

    /**
     * @brief cell の現在の定義域（埋まっているマスは空集合）
     */
    virtual DigitSet domain(const Board& board, Cell cell) const = 0;
};

/**
 * @brief 問い合わせのたびにピアを走査する定義域管理
 */
class ScanningDomainTracker : public DomainTracker {
public:
    std::string name() const override { return "scan"; }
    void reset(const Board& board) override;
    void on_assign(const Board& board, Cell cell, Digit value) override;
    void on_unassign(const Board& board, Cell cell, Digit value) override;
    DigitSet domain(const Board& board, Cell cell) const override;
};

/**
 * @brief 行/列/ボックスごとの数字出現数を差分更新する定義域管理
 *
 * assign/unassign は O(1)、domain は O(9)。
 */
class CountingDomainTracker : public DomainTracker {
public:
    CountingDomainTracker();

    std::string name() const override { return "count"; }
    void reset(const Board& board) override;
    void on_assign(const Board& board, Cell cell, Digit value) override;
    void on_unassign(const Board& board, Cell cell, Digit value) override;
    DigitSet domain(const Board& board, Cell cell) const override;

private:
    // [unit][digit]、digit は 1..9（0 は未使用）
    using UnitCounts = std::array<std::array<uint8_t, GRID_SIZE + 1>, GRID_SIZE>;

    void clear();

    UnitCounts row_count_;
    UnitCounts col_count_;
    UnitCounts box_count_;
};

/**
 * @brief 方式に応じた DomainTracker を作成
 */
std::unique_ptr<DomainTracker> make_domain_tracker(DomainStrategy strategy);

} // namespace mrv_sudoku

#endif // MRV_SUDOKU_DOMAIN_TRACKER_HPP
