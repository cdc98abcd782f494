/**
 * @file time_guard.hpp
 * @brief 探索の制限時間（絶対期限）
 */
#ifndef MRV_SUDOKU_TIME_GUARD_HPP
#define MRV_SUDOKU_TIME_GUARD_HPP

#include <chrono>
#include <functional>

namespace mrv_sudoku {

/**
 * @brief 現在時刻を返す関数（テストで差し替え可能）
 */
using Clock = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief デフォルトの制限時間（1時間）
 */
constexpr std::chrono::seconds DEFAULT_TIME_LIMIT{3600};

/**
 * @brief 探索開始時刻 + 制限時間 を期限として保持する
 *
 * 探索を止めるのは呼び出し側（Solver）の責任で、TimeGuard は問い合わせに答えるだけ。
 */
class TimeGuard {
public:
    /**
     * @param budget 制限時間
     * @param clock 時刻関数（nullptr なら std::chrono::steady_clock::now）
     */
    explicit TimeGuard(std::chrono::steady_clock::duration budget, Clock clock = nullptr);

    /**
     * @brief 期限を過ぎたか
     */
    bool expired() const;

    std::chrono::steady_clock::time_point deadline() const { return deadline_; }

    /**
     * @brief 開始からの経過時間
     */
    std::chrono::steady_clock::duration elapsed() const;

private:
    Clock clock_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point deadline_;
};

} // namespace mrv_sudoku

#endif // MRV_SUDOKU_TIME_GUARD_HPP
