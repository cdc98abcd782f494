#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include "mrv_sudoku/board.hpp"
#include "mrv_sudoku/domain_tracker.hpp"
#include "puzzles.hpp"
#include <random>
#include <vector>

using namespace mrv_sudoku;

namespace {

// Definition of a domain, computed without peers(): every other cell
// sharing a row, column or box excludes its value.
DigitSet reference_domain(const Board& board, Cell cell) {
    if (!board.is_empty(cell)) {
        return DigitSet();
    }
    DigitSet result = DigitSet::all();
    for (int r = 0; r < 9; ++r) {
        for (int c = 0; c < 9; ++c) {
            Cell other{r, c};
            if (other == cell) continue;
            bool peer = r == cell.row || c == cell.col || other.box() == cell.box();
            if (peer && board.get(other) != 0) {
                result.remove(board.get(other));
            }
        }
    }
    return result;
}

void require_all_domains_match(const Board& board, const DomainTracker& tracker) {
    for (int r = 0; r < 9; ++r) {
        for (int c = 0; c < 9; ++c) {
            Cell cell{r, c};
            REQUIRE(tracker.domain(board, cell) == reference_domain(board, cell));
        }
    }
}

}  // namespace

// ============================================================================
// DigitSet tests
// ============================================================================

TEST_CASE("DigitSet basic operations", "[digit_set]") {
    DigitSet s;
    REQUIRE(s.empty());
    REQUIRE(s.size() == 0);

    s.insert(3);
    s.insert(9);
    s.insert(1);
    REQUIRE(s.size() == 3);
    REQUIRE(s.contains(1));
    REQUIRE(s.contains(9));
    REQUIRE(!s.contains(2));
    REQUIRE(!s.contains(0));
    REQUIRE(!s.contains(10));
    REQUIRE(s.values() == std::vector<Digit>{1, 3, 9});

    s.remove(3);
    REQUIRE(s.values() == std::vector<Digit>{1, 9});

    REQUIRE(DigitSet::all().size() == 9);
    REQUIRE(DigitSet::all().values() == std::vector<Digit>{1, 2, 3, 4, 5, 6, 7, 8, 9});
}

// ============================================================================
// Domain contract tests (both strategies)
// ============================================================================

TEMPLATE_TEST_CASE("DomainTracker matches peer exclusion after reset", "[domain_tracker]",
                   CountingDomainTracker, ScanningDomainTracker) {
    TestType tracker;

    SECTION("empty board") {
        Board board;
        tracker.reset(board);
        require_all_domains_match(board, tracker);
    }

    SECTION("17-clue puzzle") {
        auto board = puzzles::board_from_string(puzzles::HARD17);
        tracker.reset(board);
        require_all_domains_match(board, tracker);
    }

    SECTION("filled cells have an empty domain") {
        auto board = puzzles::board_from_string(puzzles::EASY);
        tracker.reset(board);
        REQUIRE(tracker.domain(board, Cell{0, 3}).empty());
    }
}

TEMPLATE_TEST_CASE("DomainTracker assign shrinks every empty peer", "[domain_tracker]",
                   CountingDomainTracker, ScanningDomainTracker) {
    Board board;
    TestType tracker;
    tracker.reset(board);

    board.assign(Cell{4, 4}, 7, tracker);

    for (const auto& p : peers(Cell{4, 4})) {
        auto d = tracker.domain(board, p);
        REQUIRE(!d.contains(7));
        REQUIRE(d.size() == 8);
    }
    // ピアでないマスは変わらない
    REQUIRE(tracker.domain(board, Cell{0, 0}) == DigitSet::all());

    board.unassign(Cell{4, 4}, tracker);
    for (const auto& p : peers(Cell{4, 4})) {
        REQUIRE(tracker.domain(board, p) == DigitSet::all());
    }
}

TEMPLATE_TEST_CASE("DomainTracker stays exact over random assign/unassign sequences",
                   "[domain_tracker]", CountingDomainTracker, ScanningDomainTracker) {
    auto board = puzzles::board_from_string(puzzles::HARD17);
    TestType tracker;
    tracker.reset(board);

    std::mt19937 rng(20240917);
    std::vector<Cell> assigned;

    for (int step = 0; step < 300; ++step) {
        bool do_assign = assigned.empty() || (rng() % 3 != 0);

        if (do_assign) {
            std::vector<Cell> choices;
            for (int i = 0; i < 81; ++i) {
                Cell cell{i / 9, i % 9};
                if (board.is_empty(cell) && !tracker.domain(board, cell).empty()) {
                    choices.push_back(cell);
                }
            }
            if (choices.empty()) {
                do_assign = false;
            } else {
                Cell cell = choices[rng() % choices.size()];
                auto values = tracker.domain(board, cell).values();
                board.assign(cell, values[rng() % values.size()], tracker);
                assigned.push_back(cell);
            }
        }

        if (!do_assign && !assigned.empty()) {
            board.unassign(assigned.back(), tracker);
            assigned.pop_back();
        }

        REQUIRE(!board.has_conflict());
        require_all_domains_match(board, tracker);
    }

    // 全て取り消せば初期状態に戻る
    while (!assigned.empty()) {
        board.unassign(assigned.back(), tracker);
        assigned.pop_back();
    }
    REQUIRE(board == puzzles::board_from_string(puzzles::HARD17));
    require_all_domains_match(board, tracker);
}

TEST_CASE("make_domain_tracker", "[domain_tracker]") {
    REQUIRE(make_domain_tracker(DomainStrategy::Counting)->name() == "count");
    REQUIRE(make_domain_tracker(DomainStrategy::Scanning)->name() == "scan");
}
