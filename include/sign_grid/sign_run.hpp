/**
 * @file sign_run.hpp
 * @brief 同符号連の置換回数解析
 */
#ifndef SIGN_GRID_SIGN_RUN_HPP
#define SIGN_GRID_SIGN_RUN_HPP

#include "sign_grid/cell.hpp"
#include <cstddef>
#include <vector>

namespace sign_grid {

/**
 * @brief 同符号の極大連（Neutral を含まない）
 */
struct SignRun {
    size_t begin;   // 先頭の列インデックス
    size_t length;
    Sign sign;
};

/**
 * @brief 行を同符号の極大連に分割
 *
 * Neutral セルは連を切り、どの連にも含まれない。
 */
std::vector<SignRun> sign_runs(const Row& row);

/**
 * @brief 3連以上の同符号が残らないための最小置換回数
 *
 * 各極大連の長さ L について floor(L / 3) を加算する。
 * 空行は 0。
 */
size_t min_replacements(const Row& row);

} // namespace sign_grid

#endif // SIGN_GRID_SIGN_RUN_HPP
