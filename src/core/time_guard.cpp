#include "mrv_sudoku/time_guard.hpp"
#include <utility>

namespace mrv_sudoku {

TimeGuard::TimeGuard(std::chrono::steady_clock::duration budget, Clock clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    start_ = clock_();
    deadline_ = start_ + budget;
}

bool TimeGuard::expired() const {
    return clock_() > deadline_;
}

std::chrono::steady_clock::duration TimeGuard::elapsed() const {
    return clock_() - start_;
}

} // namespace mrv_sudoku
