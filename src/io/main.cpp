#include "mrv_sudoku/io/puzzle_io.hpp"
#include "mrv_sudoku/solver.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

mrv_sudoku::Solver* g_current_solver = nullptr;

void interrupt_handler(int) {
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-t SEC] [-d count|scan] <puzzle.txt>\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print search progress)\n";
    std::cerr << "  -t SEC  Time limit in seconds (default 3600)\n";
    std::cerr << "  -d STR  Domain tracking strategy: count (default) or scan\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const mrv_sudoku::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: nodes=" << s.node_count
              << " assignments=" << s.assignment_count
              << " undos=" << s.undo_count
              << " dead_ends=" << s.dead_end_count
              << " max_depth=" << s.max_depth
              << "\n";
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    int timeout_sec = 0;
    auto strategy = mrv_sudoku::DomainStrategy::Counting;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
            if (timeout_sec <= 0) {
                std::cerr << "Invalid time limit: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            const char* name = argv[++i];
            if (std::strcmp(name, "count") == 0) {
                strategy = mrv_sudoku::DomainStrategy::Counting;
            } else if (std::strcmp(name, "scan") == 0) {
                strategy = mrv_sudoku::DomainStrategy::Scanning;
            } else {
                std::cerr << "Unknown domain strategy: " << name << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto board = mrv_sudoku::io::load_puzzle(filename);

        mrv_sudoku::Solver solver;
        solver.set_verbose(g_verbose);
        solver.set_domain_strategy(strategy);
        if (timeout_sec > 0) {
            solver.set_time_limit(std::chrono::seconds(timeout_sec));
        }
        g_current_solver = &solver;
        std::signal(SIGINT, interrupt_handler);

        std::cout << "Initial:\n";
        mrv_sudoku::io::print_board(std::cout, board);

        auto result = solver.solve(board);
        g_current_solver = nullptr;
        print_stats(solver);

        std::cout << "\nFinal:\n";
        mrv_sudoku::io::print_board(std::cout, result.board);
        std::cout << "=====" << mrv_sudoku::io::outcome_name(result.outcome) << "=====\n";

        double seconds = std::chrono::duration<double>(result.elapsed).count();
        std::cout << "Time: " << std::fixed << std::setprecision(3) << seconds << "s\n";

        std::cout << "\nFirst 4 assignments:\n";
        mrv_sudoku::io::print_moves(std::cout, result.moves);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
