/**
 * @file solver.hpp
 * @brief 数独ソルバークラス（MRV + Degree によるバックトラック探索、制限時間付き）
 */
#ifndef MRV_SUDOKU_SOLVER_HPP
#define MRV_SUDOKU_SOLVER_HPP

#include "mrv_sudoku/board.hpp"
#include "mrv_sudoku/domain_tracker.hpp"
#include "mrv_sudoku/move_recorder.hpp"
#include "mrv_sudoku/time_guard.hpp"
#include <atomic>
#include <utility>
#include <chrono>
#include <vector>

namespace mrv_sudoku {

/**
 * @brief solve() の結果種別
 */
enum class Outcome {
    SOLVED,      // 解が見つかった
    UNSOLVABLE,  // 探索し尽くして解が無い
    TIMED_OUT    // 制限時間切れ（または stop()）
};

/**
 * @brief 1段の探索結果（DEAD_END は solve() の外に出ない）
 */
enum class SearchResult {
    SOLVED,
    DEAD_END,
    TIMED_OUT
};

/**
 * @brief 探索結果
 */
struct SolveResult {
    Outcome outcome;
    Board board;                    // SOLVED なら完全な解、それ以外は途中の盤面
    std::vector<MoveRecord> moves;  // 最初の4手（最大4件）
    std::chrono::steady_clock::duration elapsed;
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;        // run_search() の呼び出し回数
    size_t assignment_count = 0;
    size_t undo_count = 0;
    size_t dead_end_count = 0;
    size_t max_depth = 0;
};

/**
 * @brief 数独ソルバー
 *
 * 1つの盤面を深さ優先で探索する。盤面と定義域は再帰の各段で直接変更し、
 * 失敗した段は自分の割り当てを取り消してから戻る。
 */
class Solver {
public:
    Solver();

    /**
     * @brief 盤面を解く
     * @param initial 検証済みの初期盤面（ピア間の矛盾が無いこと）
     */
    SolveResult solve(const Board& initial);

    /**
     * @brief 直近の solve() の統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 制限時間を設定（デフォルト DEFAULT_TIME_LIMIT）
     */
    void set_time_limit(std::chrono::steady_clock::duration limit) { time_limit_ = limit; }

    std::chrono::steady_clock::duration time_limit() const { return time_limit_; }

    /**
     * @brief 時刻関数を差し替える（nullptr で steady_clock に戻る）
     */
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    /**
     * @brief 定義域の更新方式を設定
     */
    void set_domain_strategy(DomainStrategy strategy) { domain_strategy_ = strategy; }

    DomainStrategy domain_strategy() const { return domain_strategy_; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief 再帰探索
     *
     * 戻り値が DEAD_END のとき、この段で行った変更は全て取り消されている。
     * SOLVED / TIMED_OUT のときは盤面をそのまま残して戻る。
     */
    SearchResult run_search(Board& board, DomainTracker& tracker, const TimeGuard& guard,
                            MoveRecorder& recorder, size_t depth);

    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    // 設定
    std::chrono::steady_clock::duration time_limit_;
    Clock clock_;
    DomainStrategy domain_strategy_ = DomainStrategy::Counting;

    // 統計
    SolverStats stats_;
};

} // namespace mrv_sudoku

#endif // MRV_SUDOKU_SOLVER_HPP
