#include "mrv_sudoku/solver.hpp"
#include "mrv_sudoku/selector.hpp"
#include <iostream>
#include <stdexcept>

namespace mrv_sudoku {

Solver::Solver()
    : time_limit_(DEFAULT_TIME_LIMIT) {}

SolveResult Solver::solve(const Board& initial) {
    stats_ = SolverStats{};

    // 探索中に変更する盤面と定義域は呼び出しごとに作る
    Board board = initial;
    auto tracker = make_domain_tracker(domain_strategy_);
    tracker->reset(board);
    MoveRecorder recorder;
    TimeGuard guard(time_limit_, clock_);

    if (verbose_) {
        std::cerr << "% [verbose] search start: " << board.empty_count() << " empty cells, domain="
                  << tracker->name() << ", time_limit="
                  << std::chrono::duration_cast<std::chrono::seconds>(time_limit_).count() << "s\n";
    }

    auto res = run_search(board, *tracker, guard, recorder, 0);

    Outcome outcome = Outcome::UNSOLVABLE;
    switch (res) {
        case SearchResult::SOLVED:
            if (!board.is_valid_solution()) {
                throw std::logic_error("Solver::solve() produced an invalid solution");
            }
            outcome = Outcome::SOLVED;
            break;
        case SearchResult::DEAD_END:
            // 戻る先の無い行き止まり
            outcome = Outcome::UNSOLVABLE;
            break;
        case SearchResult::TIMED_OUT:
            outcome = Outcome::TIMED_OUT;
            break;
    }

    if (verbose_) {
        if (outcome == Outcome::TIMED_OUT) {
            std::cerr << "% [verbose] search stopped ("
                      << (stopped_ ? "stop requested" : "timeout") << ")\n";
        }
        std::cerr << "% [verbose] search done: nodes=" << stats_.node_count
                  << " assignments=" << stats_.assignment_count
                  << " dead_ends=" << stats_.dead_end_count << "\n";
    }

    return SolveResult{outcome, board, recorder.moves(), guard.elapsed()};
}

SearchResult Solver::run_search(Board& board, DomainTracker& tracker, const TimeGuard& guard,
                                MoveRecorder& recorder, size_t depth) {
    // タイムアウトチェック（再帰の入口ごと）
    if (stopped_ || guard.expired()) {
        return SearchResult::TIMED_OUT;
    }

    // 統計更新
    stats_.node_count++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    auto selection = select_next(board, tracker);
    if (!selection) {
        return SearchResult::SOLVED;
    }

    // 定義域が空のマスがある → 割り当てずに戻る
    if (selection->domain.empty()) {
        stats_.dead_end_count++;
        return SearchResult::DEAD_END;
    }

    const Cell cell = selection->cell;
    for (Digit value : selection->domain.values()) {
        board.assign(cell, value, tracker);
        stats_.assignment_count++;

        if (recorder.record(stats_.assignment_count, cell, selection->domain.size(),
                            selection->degree, value) && verbose_) {
            std::cerr << "% [verbose] move #" << stats_.assignment_count << " " << to_string(cell)
                      << " domain=" << selection->domain.size()
                      << " degree=" << selection->degree << " value=" << value << "\n";
        }

        auto res = run_search(board, tracker, guard, recorder, depth + 1);
        if (res != SearchResult::DEAD_END) {
            // SOLVED: 割り当ては解の一部として残す
            // TIMED_OUT: 途中の盤面のまま巻き戻す
            return res;
        }

        board.unassign(cell, tracker);
        stats_.undo_count++;
    }

    stats_.dead_end_count++;
    return SearchResult::DEAD_END;
}

} // namespace mrv_sudoku
