#include "sign_grid/global_min.hpp"

namespace sign_grid {

bool GlobalMinResult::matches(const Cell& cell) const {
    if (!value) return false;
    auto cmp = compare_numeric(cell, *value);
    return cmp && *cmp == 0;
}

GlobalMinResult find_global_min(const Grid& grid) {
    GlobalMinResult result;

    for (size_t r = 0; r < grid.size(); ++r) {
        const auto& row = grid[r];
        for (size_t c = 0; c < row.size(); ++c) {
            const Cell& cell = row[c];
            if (!cell.is_numeric()) continue;

            if (!result.value) {
                result.value = cell;
                result.positions.push_back({r, c});
                continue;
            }

            int cmp = *compare_numeric(cell, *result.value);
            if (cmp < 0) {
                // より小さい値: 位置リストをリセット
                result.value = cell;
                result.positions.clear();
                result.positions.push_back({r, c});
            } else if (cmp == 0) {
                result.positions.push_back({r, c});
            }
        }
    }

    for (const auto& pos : result.positions) {
        result.rows_with_min.insert(pos.row);
    }
    return result;
}

} // namespace sign_grid
