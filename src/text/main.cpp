#include "sign_grid/text/grid_literal.hpp"
#include "sign_grid/generator.hpp"
#include "sign_grid/global_min.hpp"
#include "sign_grid/renderer.hpp"
#include "sign_grid/sign_run.hpp"
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [file.grid]\n";
    std::cerr << "  -r ROWS       Rows of the generated grid (default 10)\n";
    std::cerr << "  -c COLS       Columns of the generated grid (default 10)\n";
    std::cerr << "  --min N       Lower bound of generated values (default -100)\n";
    std::cerr << "  --max N       Upper bound of generated values (default 100)\n";
    std::cerr << "  --seed N      Seed the generator for a reproducible grid\n";
    std::cerr << "  -g LITERAL    Analyze a grid literal, e.g. \"[[3,3,3,-1],[5,-5,5]]\"\n";
    std::cerr << "  --color       Force colored output\n";
    std::cerr << "  --no-color    Disable colored output\n";
    std::cerr << "  -v            Verbose mode (print diagnostics to stderr)\n";
}

bool g_verbose = false;

void print_analysis_stats(const sign_grid::Grid& grid, double elapsed_ms) {
    if (!g_verbose) return;
    auto global_min = sign_grid::find_global_min(grid);
    size_t total_replacements = 0;
    for (const auto& row : grid) {
        total_replacements += sign_grid::min_replacements(row);
    }
    std::cerr << "% Stats: rows=" << grid.size()
              << " cols=" << sign_grid::max_row_length(grid)
              << " min_positions=" << global_min.positions.size()
              << " replacements=" << total_replacements
              << " time_ms=" << elapsed_ms
              << "\n";
}

int main(int argc, char* argv[]) {
    std::string rows_arg;
    std::string cols_arg;
    std::string min_arg;
    std::string max_arg;
    std::string seed_arg;
    const char* literal = nullptr;
    const char* filename = nullptr;
    std::optional<bool> use_colors;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            rows_arg = argv[++i];
        } else if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            cols_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--min") == 0 && i + 1 < argc) {
            min_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--max") == 0 && i + 1 < argc) {
            max_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            seed_arg = argv[++i];
        } else if (std::strcmp(argv[i], "-g") == 0 && i + 1 < argc) {
            literal = argv[++i];
        } else if (std::strcmp(argv[i], "--color") == 0) {
            use_colors = true;
        } else if (std::strcmp(argv[i], "--no-color") == 0) {
            use_colors = false;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
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

    if (literal && filename) {
        std::cerr << "Error: -g and a grid file are mutually exclusive\n";
        return 1;
    }

    if (g_verbose && (literal || filename) &&
        !(rows_arg.empty() && cols_arg.empty() && min_arg.empty() &&
          max_arg.empty() && seed_arg.empty())) {
        std::cerr << "% Warning: -r/-c/--min/--max/--seed are ignored when reading a grid\n";
    }

    try {
        sign_grid::Grid grid;

        if (literal) {
            if (g_verbose) std::cerr << "% Source: literal\n";
            grid = sign_grid::text::parse_string(literal);
        } else if (filename) {
            if (g_verbose) std::cerr << "% Source: " << filename << "\n";
            grid = sign_grid::text::parse_file(filename);
        } else {
            int64_t rows = rows_arg.empty() ? sign_grid::DEFAULT_ROWS
                                            : sign_grid::parse_dimension(rows_arg);
            int64_t cols = cols_arg.empty() ? sign_grid::DEFAULT_COLS
                                            : sign_grid::parse_dimension(cols_arg);
            auto min = min_arg.empty() ? sign_grid::DEFAULT_MIN_VALUE
                                       : sign_grid::parse_bound(min_arg);
            auto max = max_arg.empty() ? sign_grid::DEFAULT_MAX_VALUE
                                       : sign_grid::parse_bound(max_arg);

            if (g_verbose) {
                std::cerr << "% Source: generated " << rows << "x" << cols
                          << " range=[" << min << "," << max << "]"
                          << " seed=" << (seed_arg.empty() ? "random" : seed_arg) << "\n";
            }

            if (seed_arg.empty()) {
                sign_grid::GridGenerator generator;
                grid = generator.generate(rows, cols, min, max);
            } else {
                sign_grid::GridGenerator generator(sign_grid::parse_seed(seed_arg));
                grid = generator.generate(rows, cols, min, max);
            }
        }

        sign_grid::RenderOptions options;
        options.use_colors = use_colors ? *use_colors : sign_grid::stdout_is_terminal();

        auto start = std::chrono::steady_clock::now();
        sign_grid::render(grid, options);
        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        print_analysis_stats(grid, elapsed);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
