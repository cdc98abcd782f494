#include "mrv_sudoku/io/puzzle_io.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mrv_sudoku {
namespace io {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char ch) { return std::isspace(ch) != 0; });
}

Digit parse_value(const std::string& token, size_t line_no) {
    bool numeric = !token.empty() &&
                   std::all_of(token.begin(), token.end(),
                               [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!numeric) {
        throw std::runtime_error("Line " + std::to_string(line_no) +
                                 ": invalid value '" + token + "'");
    }
    // 先頭の 0 は許す（"07" = 7）
    size_t first = token.find_first_not_of('0');
    if (first == std::string::npos) {
        return 0;
    }
    if (token.size() - first > 1) {
        throw std::runtime_error("Line " + std::to_string(line_no) +
                                 ": value out of range (0-9): " + token);
    }
    return static_cast<Digit>(token[first] - '0');
}

}  // namespace

Board parse_puzzle(const std::string& input) {
    std::vector<std::vector<Digit>> rows;
    std::istringstream in(input);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) {
            continue;
        }
        if (rows.size() == GRID_SIZE) {
            throw std::runtime_error("Line " + std::to_string(line_no) +
                                     ": expected 9 rows, found extra row");
        }

        std::vector<Digit> row;
        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            row.push_back(parse_value(token, line_no));
        }
        if (row.size() != GRID_SIZE) {
            throw std::runtime_error("Line " + std::to_string(line_no) +
                                     ": expected 9 values, got " + std::to_string(row.size()));
        }
        rows.push_back(std::move(row));
    }

    if (rows.size() != GRID_SIZE) {
        throw std::runtime_error("Expected 9 rows, got " + std::to_string(rows.size()));
    }

    Board board = Board::from_rows(rows);

    // 初期配置の矛盾は読み込み側で弾く（ソルバーは検査しない）
    if (auto conflict = board.find_conflict()) {
        throw std::runtime_error("Conflicting givens at " + to_string(conflict->first) +
                                 " and " + to_string(conflict->second) + ": " +
                                 std::to_string(board.get(conflict->first)));
    }
    return board;
}

Board load_puzzle(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse_puzzle(content.str());
}

void print_board(std::ostream& out, const Board& board) {
    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            if (c > 0) out << ' ';
            Digit v = board.get(Cell{r, c});
            if (v == 0) {
                out << '.';
            } else {
                out << v;
            }
        }
        out << '\n';
    }
}

void print_moves(std::ostream& out, const std::vector<MoveRecord>& moves) {
    for (const auto& move : moves) {
        out << move.order << ") var=" << to_string(move.cell)
            << ", domain=" << move.domain_size
            << ", degree=" << move.degree
            << ", value=" << move.value << '\n';
    }
}

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::SOLVED:
            return "SOLVED";
        case Outcome::UNSOLVABLE:
            return "UNSOLVABLE";
        case Outcome::TIMED_OUT:
            return "TIMED_OUT";
    }
    return "UNKNOWN";
}

} // namespace io
} // namespace mrv_sudoku
