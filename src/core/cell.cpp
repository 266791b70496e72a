#include "sign_grid/cell.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>

namespace sign_grid {

std::optional<double> Cell::numeric() const {
    if (auto iv = std::get_if<value_type>(&data_)) {
        return static_cast<double>(*iv);
    }
    if (auto dv = std::get_if<double>(&data_)) {
        if (std::isnan(*dv)) return std::nullopt;
        return *dv;
    }
    return std::nullopt;
}

bool Cell::is_numeric() const {
    if (is_integer()) return true;
    auto dv = std::get_if<double>(&data_);
    return dv && !std::isnan(*dv);
}

Sign Cell::sign() const {
    // 整数は double を経由せずに判定する
    if (auto iv = std::get_if<value_type>(&data_)) {
        if (*iv > 0) return Sign::Positive;
        if (*iv < 0) return Sign::Negative;
        return Sign::Neutral;
    }
    auto v = numeric();
    if (!v) return Sign::Neutral;
    if (*v > 0) return Sign::Positive;
    if (*v < 0) return Sign::Negative;
    return Sign::Neutral;
}

std::string Cell::to_string() const {
    if (auto iv = std::get_if<value_type>(&data_)) {
        return std::to_string(*iv);
    }
    if (auto dv = std::get_if<double>(&data_)) {
        return format_number(*dv);
    }
    if (auto sv = std::get_if<std::string>(&data_)) {
        return *sv;
    }
    return EMPTY_CELL;
}

namespace {

int compare_int_real(Cell::value_type i, double d) {
    // 2^63: int64_t の範囲外の実数は整数と重ならない
    constexpr double TWO_POW_63 = 9223372036854775808.0;
    if (d >= TWO_POW_63) return -1;
    if (d < -TWO_POW_63) return 1;

    double whole = std::trunc(d);
    auto t = static_cast<Cell::value_type>(whole);
    if (i < t) return -1;
    if (i > t) return 1;
    double frac = d - whole;
    if (frac > 0) return -1;
    if (frac < 0) return 1;
    return 0;
}

template <typename T>
int three_way(T a, T b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

} // namespace

std::optional<int> compare_numeric(const Cell& a, const Cell& b) {
    if (!a.is_numeric() || !b.is_numeric()) return std::nullopt;

    auto ai = std::get_if<Cell::value_type>(&a.data_);
    auto bi = std::get_if<Cell::value_type>(&b.data_);
    if (ai && bi) return three_way(*ai, *bi);
    if (ai) return compare_int_real(*ai, std::get<double>(b.data_));
    if (bi) return -compare_int_real(*bi, std::get<double>(a.data_));
    return three_way(std::get<double>(a.data_), std::get<double>(b.data_));
}

std::optional<Cell> cell_at(const Row& row, size_t col) {
    if (col >= row.size()) return std::nullopt;
    return row[col];
}

size_t max_row_length(const Grid& grid) {
    size_t n = 0;
    for (const auto& row : grid) {
        n = std::max(n, row.size());
    }
    return n;
}

std::string format_number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    if (value == 0.0) return "0";  // -0 も "0"

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buf, ptr);
}

} // namespace sign_grid
