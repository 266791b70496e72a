/**
 * @file generator.hpp
 * @brief 乱数グリッド生成
 */
#ifndef SIGN_GRID_GENERATOR_HPP
#define SIGN_GRID_GENERATOR_HPP

#include "sign_grid/cell.hpp"
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

namespace sign_grid {

constexpr int64_t DEFAULT_ROWS = 10;
constexpr int64_t DEFAULT_COLS = 10;
constexpr Cell::value_type DEFAULT_MIN_VALUE = -100;
constexpr Cell::value_type DEFAULT_MAX_VALUE = 100;

/**
 * @brief 行数・列数が正の整数でない
 */
class InvalidDimension : public std::invalid_argument {
public:
    explicit InvalidDimension(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief 一様乱数で整数グリッドを生成する
 *
 * 各セルは [min, max] から独立に一様サンプリングする。
 * min > max の場合は入れ替えてから使う（エラーではない）。
 */
class GridGenerator {
public:
    /**
     * @brief std::random_device でシードした生成器
     */
    GridGenerator();

    /**
     * @brief 固定シードの生成器（再現可能）
     */
    explicit GridGenerator(uint64_t seed);

    /**
     * @brief グリッドを生成
     * @param rows 行数（正）
     * @param cols 列数（正）
     * @param min 下限（両端含む）
     * @param max 上限（両端含む）
     * @throws InvalidDimension rows または cols が正でない場合
     */
    Grid generate(int64_t rows = DEFAULT_ROWS,
                  int64_t cols = DEFAULT_COLS,
                  Cell::value_type min = DEFAULT_MIN_VALUE,
                  Cell::value_type max = DEFAULT_MAX_VALUE);

private:
    std::mt19937_64 rng_;
};

/**
 * @brief 非決定的なシードでグリッドを1つ生成
 */
Grid generate(int64_t rows = DEFAULT_ROWS,
              int64_t cols = DEFAULT_COLS,
              Cell::value_type min = DEFAULT_MIN_VALUE,
              Cell::value_type max = DEFAULT_MAX_VALUE);

/**
 * @brief コマンドライン文字列を行数・列数に変換
 * @throws InvalidDimension 正の10進整数でない場合
 */
int64_t parse_dimension(const std::string& text);

/**
 * @brief コマンドライン文字列を値域の境界に変換
 * @throws std::invalid_argument 10進整数でない場合
 */
Cell::value_type parse_bound(const std::string& text);

/**
 * @brief コマンドライン文字列を乱数シードに変換
 * @throws std::invalid_argument 符号なし10進整数でない場合
 */
uint64_t parse_seed(const std::string& text);

} // namespace sign_grid

#endif // SIGN_GRID_GENERATOR_HPP
