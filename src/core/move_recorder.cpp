#include "mrv_sudoku/move_recorder.hpp"

namespace mrv_sudoku {

bool MoveRecorder::record(size_t order, Cell cell, size_t domain_size, int degree, Digit value) {
    if (full()) {
        return false;
    }
    moves_.push_back(MoveRecord{order, cell, domain_size, degree, value});
    return true;
}

} // namespace mrv_sudoku
