/**
 * @file puzzle_io.hpp
 * @brief パズルファイルの読み込みと結果の表示
 */
#ifndef MRV_SUDOKU_IO_PUZZLE_IO_HPP
#define MRV_SUDOKU_IO_PUZZLE_IO_HPP

#include "mrv_sudoku/board.hpp"
#include "mrv_sudoku/move_recorder.hpp"
#include "mrv_sudoku/solver.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace mrv_sudoku {
namespace io {

/**
 * @brief パズルのテキストを解析
 *
 * 空行を除いて9行、各行は空白区切りの整数9個（0..9、0 = 空き）。
 * @throws std::runtime_error 書式エラー、または初期配置にピア間の矛盾がある
 */
Board parse_puzzle(const std::string& input);

/**
 * @brief パズルファイルを読み込む
 * @throws std::runtime_error ファイルが開けない、または parse_puzzle() のエラー
 */
Board load_puzzle(const std::string& filename);

/**
 * @brief 盤面を9行で出力（空きは '.'）
 */
void print_board(std::ostream& out, const Board& board);

/**
 * @brief 記録された手を1行ずつ出力
 */
void print_moves(std::ostream& out, const std::vector<MoveRecord>& moves);

const char* outcome_name(Outcome outcome);

} // namespace io
} // namespace mrv_sudoku

#endif // MRV_SUDOKU_IO_PUZZLE_IO_HPP
