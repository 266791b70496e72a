#include "sign_grid/renderer.hpp"
#include "sign_grid/sign_run.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>
#include <unistd.h>

namespace sign_grid {

namespace {

constexpr size_t MIN_CELL_WIDTH = 4;
constexpr size_t CELL_PADDING = 1;

const std::string MIN_POS_LABEL = "minPos";
const std::string REPLACE_LABEL = "replace";

size_t u8_len(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;
}

std::string format_cell(const std::string& text, size_t width, bool highlight, bool use_colors) {
    std::string s = pad_left(text, width);
    if (highlight && use_colors) {
        return std::string(ansi::YELLOW_BG) + ansi::BOLD + s + ansi::RESET;
    }
    return s;
}

/**
 * @brief 1行分の表示用データ
 */
struct RowSummary {
    std::string min_positive;
    std::string replacements;
};

} // namespace

bool stdout_is_terminal() {
    return ::isatty(STDOUT_FILENO) == 1;
}

size_t display_cols(const std::string& s) {
    size_t cols = 0;
    for (size_t i = 0; i < s.size();) {
        // ANSI エスケープシーケンスは幅に含めない
        if (s[i] == '\x1B' && i + 1 < s.size() && s[i + 1] == '[') {
            i += 2;
            while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
            if (i < s.size()) i++;
            continue;
        }
        i += u8_len(static_cast<unsigned char>(s[i]));
        cols += 1;
    }
    return cols;
}

std::string pad_left(const std::string& s, size_t width) {
    size_t cols = display_cols(s);
    if (cols >= width) return s;
    return std::string(width - cols, ' ') + s;
}

size_t column_width(const Grid& grid) {
    size_t longest = 1;
    for (const auto& row : grid) {
        for (const auto& cell : row) {
            longest = std::max(longest, display_cols(cell.to_string()));
        }
    }
    return std::max(MIN_CELL_WIDTH, longest) + CELL_PADDING;
}

std::optional<Cell> min_positive(const Row& row) {
    std::optional<Cell> best;
    for (const auto& cell : row) {
        if (cell.sign() != Sign::Positive) continue;
        if (!best || *compare_numeric(cell, *best) < 0) {
            best = cell;
        }
    }
    return best;
}

void render(const Grid& grid, const RenderOptions& options, std::ostream& out) {
    if (grid.empty()) {
        out << "Grid is empty.\n";
        return;
    }

    const size_t total_rows = grid.size();
    const size_t total_cols = max_row_length(grid);
    const GlobalMinResult global_min = find_global_min(grid);
    const size_t col_width = column_width(grid);
    const size_t index_width = std::max<size_t>(2, std::to_string(total_rows - 1).size());

    std::vector<RowSummary> summaries;
    summaries.reserve(total_rows);
    size_t min_pos_width = MIN_POS_LABEL.size();
    size_t replace_width = REPLACE_LABEL.size();
    for (const auto& row : grid) {
        auto mp = min_positive(row);
        RowSummary summary{mp ? mp->to_string() : EMPTY_CELL,
                           std::to_string(min_replacements(row))};
        min_pos_width = std::max(min_pos_width, display_cols(summary.min_positive));
        replace_width = std::max(replace_width, display_cols(summary.replacements));
        summaries.push_back(std::move(summary));
    }

    // Header: "<marker> r<idx> |" と同じ幅の空白で始める
    std::string header(1 + 2 + index_width, ' ');
    header += " |";
    for (size_t c = 0; c < total_cols; ++c) {
        header += pad_left("c" + std::to_string(c), col_width);
    }
    header += " | " + pad_left(MIN_POS_LABEL, min_pos_width);
    header += " | " + pad_left(REPLACE_LABEL, replace_width);

    const std::string separator(display_cols(header), '-');

    out << "\n" << header << "\n";
    out << separator << "\n";

    for (size_t r = 0; r < total_rows; ++r) {
        const auto& row = grid[r];
        std::ostringstream line;
        line << (global_min.rows_with_min.count(r) ? ROW_MARKER : " ")
             << " r" << pad_left(std::to_string(r), index_width) << " |";

        for (size_t c = 0; c < total_cols; ++c) {
            auto cell = cell_at(row, c);
            if (!cell) {
                line << format_cell(EMPTY_CELL, col_width, false, options.use_colors);
                continue;
            }
            line << format_cell(cell->to_string(), col_width,
                                global_min.matches(*cell), options.use_colors);
        }

        line << " | " << pad_left(summaries[r].min_positive, min_pos_width)
             << " | " << pad_left(summaries[r].replacements, replace_width);
        out << line.str() << "\n";
    }

    out << separator << "\n";

    if (!global_min.found()) {
        out << "Global minimum not found (no numeric values).\n";
    } else {
        std::string positions;
        for (const auto& pos : global_min.positions) {
            if (!positions.empty()) positions += ", ";
            positions += "(r" + std::to_string(pos.row) + ",c" + std::to_string(pos.col) + ")";
        }
        std::string value = global_min.value->to_string();
        if (options.use_colors) {
            value = std::string(ansi::RED) + value + ansi::RESET;
        }
        out << "Global minimum: " << value << " found at positions: " << positions << "\n";
    }

    out << "\n";
}

void render(const Grid& grid, const RenderOptions& options) {
    render(grid, options, std::cout);
}

void render(const Grid& grid) {
    render(grid, RenderOptions{stdout_is_terminal()}, std::cout);
}

} // namespace sign_grid
