/**
 * @file grid_literal.hpp
 * @brief グリッドリテラル（[[1, 2], [3, NaN, "x"]]）の読み込み
 */
#ifndef SIGN_GRID_TEXT_GRID_LITERAL_HPP
#define SIGN_GRID_TEXT_GRID_LITERAL_HPP

#include "sign_grid/cell.hpp"
#include <string>

namespace sign_grid {
namespace text {

/**
 * @brief グリッドリテラルのファイルをパース
 * @param filename ファイル名
 * @return パースされたグリッド
 * @throws std::runtime_error ファイルが開けない場合、パースエラー時
 */
Grid parse_file(const std::string& filename);

/**
 * @brief グリッドリテラル文字列をパース
 * @param input 入力文字列
 * @return パースされたグリッド（"[]" なら空）
 * @throws std::runtime_error パースエラー時
 */
Grid parse_string(const std::string& input);

} // namespace text
} // namespace sign_grid

#endif // SIGN_GRID_TEXT_GRID_LITERAL_HPP
