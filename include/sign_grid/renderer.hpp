/**
 * @file renderer.hpp
 * @brief グリッドと行ごとの解析結果を表形式で出力
 */
#ifndef SIGN_GRID_RENDERER_HPP
#define SIGN_GRID_RENDERER_HPP

#include "sign_grid/cell.hpp"
#include "sign_grid/global_min.hpp"
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

namespace sign_grid {

/// 最小値を含む行の先頭マーカー
constexpr const char* ROW_MARKER = "*";

namespace ansi {
constexpr const char* RESET = "\x1b[0m";
constexpr const char* BOLD = "\x1b[1m";
constexpr const char* RED = "\x1b[31m";
constexpr const char* YELLOW_BG = "\x1b[43m";
} // namespace ansi

/**
 * @brief 出力オプション
 *
 * 端末かどうかの判定は呼び出し側で行い、use_colors として渡す。
 */
struct RenderOptions {
    bool use_colors = false;
};

/**
 * @brief 標準出力が対話端末か
 */
bool stdout_is_terminal();

/**
 * @brief UTF-8 の表示幅（コードポイント数、ANSI エスケープは数えない）
 */
size_t display_cols(const std::string& s);

/**
 * @brief 表示幅 width まで左を空白で埋める（切り詰めはしない）
 */
std::string pad_left(const std::string& s, size_t width);

/**
 * @brief 全列共通の列幅 max(4, 最長セル文字列) + 1
 */
size_t column_width(const Grid& grid);

/**
 * @brief 行の正の値の最小値
 * @return 正の数値セルが無ければ std::nullopt
 */
std::optional<Cell> min_positive(const Row& row);

/**
 * @brief グリッドの表を out に出力
 *
 * 行数 0 のときは空グリッドの通知のみを出力する。
 */
void render(const Grid& grid, const RenderOptions& options, std::ostream& out);

/**
 * @brief std::cout に出力
 */
void render(const Grid& grid, const RenderOptions& options);

/**
 * @brief std::cout に出力（端末なら色付き）
 */
void render(const Grid& grid);

} // namespace sign_grid

#endif // SIGN_GRID_RENDERER_HPP
