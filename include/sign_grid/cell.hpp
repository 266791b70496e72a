/**
 * @file cell.hpp
 * @brief グリッドのセル型と符号分類
 */
#ifndef SIGN_GRID_CELL_HPP
#define SIGN_GRID_CELL_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sign_grid {

/// 空セル・欠損セルの表示用マーカー
constexpr const char* EMPTY_CELL = "\xE2\x80\x94";  // U+2014

/**
 * @brief セルの符号
 *
 * ゼロ・欠損・非数値・NaN はすべて Neutral に畳み込む。
 */
enum class Sign {
    Negative = -1,
    Neutral = 0,
    Positive = 1
};

/**
 * @brief グリッドの1セル
 *
 * 欠損 / 整数 / 実数 / テキストの4状態を持つ。
 * 数値として扱えるのは整数と NaN 以外の実数のみ。
 */
class Cell {
public:
    using value_type = int64_t;

    /**
     * @brief 欠損セルを作成
     */
    Cell() = default;

    Cell(int value) : data_(static_cast<value_type>(value)) {}
    Cell(value_type value) : data_(value) {}
    Cell(double value) : data_(value) {}

    /**
     * @brief テキスト（非数値）セルを作成
     */
    explicit Cell(std::string text) : data_(std::move(text)) {}

    bool is_missing() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_integer() const { return std::holds_alternative<value_type>(data_); }
    bool is_real() const { return std::holds_alternative<double>(data_); }
    bool is_text() const { return std::holds_alternative<std::string>(data_); }

    /**
     * @brief 数値を取得
     * @return 整数または NaN 以外の実数なら値、それ以外は std::nullopt
     */
    std::optional<double> numeric() const;

    /**
     * @brief 数値セル（整数または NaN 以外の実数）か
     */
    bool is_numeric() const;

    /**
     * @brief 符号を取得
     */
    Sign sign() const;

    /**
     * @brief 表示用文字列
     *
     * 実数は最短の往復可能表記、欠損は EMPTY_CELL。
     */
    std::string to_string() const;

    bool operator==(const Cell& other) const { return data_ == other.data_; }
    bool operator!=(const Cell& other) const { return !(*this == other); }

    friend std::optional<int> compare_numeric(const Cell& a, const Cell& b);

private:
    std::variant<std::monostate, value_type, double, std::string> data_;
};

using Row = std::vector<Cell>;
using Grid = std::vector<Row>;

/**
 * @brief セル位置（0-based）
 */
struct Position {
    size_t row;
    size_t col;

    bool operator==(const Position& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

/**
 * @brief 数値セル同士を厳密に比較
 *
 * 整数同士は int64_t のまま比較し、整数と実数も丸めずに比較する。
 * @return a < b なら負、等しければ 0、a > b なら正。
 *         どちらかが数値セルでなければ std::nullopt
 */
std::optional<int> compare_numeric(const Cell& a, const Cell& b);

/**
 * @brief 行の col 番目のセルを取得
 * @return 行の長さを超える場合は std::nullopt（ragged 行の不在セル）
 */
std::optional<Cell> cell_at(const Row& row, size_t col);

/**
 * @brief グリッド中の最長行の長さ
 */
size_t max_row_length(const Grid& grid);

/**
 * @brief 数値をセルと同じ規則で文字列化
 */
std::string format_number(double value);

} // namespace sign_grid

#endif // SIGN_GRID_CELL_HPP
