/**
 * @file global_min.hpp
 * @brief グリッド全体の最小値と出現位置の探索
 */
#ifndef SIGN_GRID_GLOBAL_MIN_HPP
#define SIGN_GRID_GLOBAL_MIN_HPP

#include "sign_grid/cell.hpp"
#include <optional>
#include <set>
#include <vector>

namespace sign_grid {

/**
 * @brief 最小値の探索結果
 *
 * positions は行優先の発見順。同値はすべて保持する。
 */
struct GlobalMinResult {
    std::optional<Cell> value;       // 最初に見つかった最小値セル。数値セルが無ければ std::nullopt
    std::vector<Position> positions;
    std::set<size_t> rows_with_min;

    bool found() const { return value.has_value(); }

    /**
     * @brief セルが最小値と等しいか（compare_numeric による厳密比較）
     */
    bool matches(const Cell& cell) const;
};

/**
 * @brief 全セルを行優先で1回走査して最小値を求める
 *
 * 数値でないセル・NaN は候補にしない。
 */
GlobalMinResult find_global_min(const Grid& grid);

} // namespace sign_grid

#endif // SIGN_GRID_GLOBAL_MIN_HPP
