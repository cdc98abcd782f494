#include <catch2/catch_test_macros.hpp>
#include "mrv_sudoku/selector.hpp"
#include "puzzles.hpp"

using namespace mrv_sudoku;

// ============================================================================
// select_next tests
// ============================================================================

TEST_CASE("select_next on a complete board returns nothing", "[selector]") {
    auto board = puzzles::board_from_string(puzzles::EASY_SOLUTION);
    CountingDomainTracker tracker;
    tracker.reset(board);

    REQUIRE(!select_next(board, tracker).has_value());
}

TEST_CASE("select_next tie-breaks by row-major position", "[selector]") {
    CountingDomainTracker tracker;

    SECTION("empty board picks (0,0)") {
        Board board;
        tracker.reset(board);
        auto sel = select_next(board, tracker);
        REQUIRE(sel.has_value());
        REQUIRE(sel->cell == Cell{0, 0});
        REQUIRE(sel->domain.size() == 9);
        REQUIRE(sel->degree == 20);
    }

    SECTION("one filled cell: first peer in row-major order") {
        // (0,0) の20ピアが定義域8・Degree 19 で同点
        std::vector<std::vector<Digit>> rows(9, std::vector<Digit>(9, 0));
        rows[0][0] = 1;
        auto board = Board::from_rows(rows);
        tracker.reset(board);
        auto sel = select_next(board, tracker);
        REQUIRE(sel.has_value());
        REQUIRE(sel->cell == Cell{0, 1});
        REQUIRE(sel->domain.size() == 8);
        REQUIRE(sel->degree == 19);
    }
}

TEST_CASE("select_next prefers higher degree among equal domain sizes", "[selector]") {
    // (0,1) は行優先で最初の定義域1のマス（Degree 9）、
    // (6,4) は定義域1で Degree 11
    auto board = puzzles::board_from_string(puzzles::EASY);
    CountingDomainTracker tracker;
    tracker.reset(board);

    REQUIRE(tracker.domain(board, Cell{0, 1}).size() == 1);
    REQUIRE(board.degree(Cell{0, 1}) == 9);

    auto sel = select_next(board, tracker);
    REQUIRE(sel.has_value());
    REQUIRE(sel->cell == Cell{6, 4});
    REQUIRE(sel->domain.values() == std::vector<Digit>{2});
    REQUIRE(sel->degree == 11);
}

TEST_CASE("select_next prefers an empty domain", "[selector]") {
    // (0,8) は定義域が空（行に1..8、列に9）
    std::vector<std::vector<Digit>> rows(9, std::vector<Digit>(9, 0));
    rows[0] = {1, 2, 3, 4, 5, 6, 7, 8, 0};
    rows[3][8] = 9;
    auto board = Board::from_rows(rows);
    CountingDomainTracker tracker;
    tracker.reset(board);

    auto sel = select_next(board, tracker);
    REQUIRE(sel.has_value());
    REQUIRE(sel->cell == Cell{0, 8});
    REQUIRE(sel->domain.empty());
}

TEST_CASE("select_next satisfies MRV, degree and position ordering", "[selector]") {
    for (const auto& puzzle : {puzzles::EASY, puzzles::HARD17}) {
        auto board = puzzles::board_from_string(puzzle);
        ScanningDomainTracker tracker;
        tracker.reset(board);

        auto sel = select_next(board, tracker);
        REQUIRE(sel.has_value());
        REQUIRE(sel->domain == board.candidates(sel->cell));
        REQUIRE(sel->degree == board.degree(sel->cell));

        for (int i = 0; i < 81; ++i) {
            Cell cell{i / 9, i % 9};
            if (!board.is_empty(cell)) continue;

            size_t size = board.candidates(cell).size();
            int degree = board.degree(cell);
            REQUIRE(size >= sel->domain.size());
            if (size == sel->domain.size()) {
                REQUIRE(degree <= sel->degree);
                if (degree == sel->degree) {
                    REQUIRE(cell.index() >= sel->cell.index());
                }
            }
        }
    }
}

TEST_CASE("select_next on the 17-clue puzzle", "[selector]") {
    auto board = puzzles::board_from_string(puzzles::HARD17);
    CountingDomainTracker tracker;
    tracker.reset(board);

    auto sel = select_next(board, tracker);
    REQUIRE(sel.has_value());
    REQUIRE(sel->cell == Cell{6, 4});
    REQUIRE(sel->domain.values() == std::vector<Digit>{7});
    REQUIRE(sel->degree == 12);
}
