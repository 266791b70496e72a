#include "sign_grid/generator.hpp"
#include <charconv>
#include <utility>

namespace sign_grid {

namespace {

bool parse_int64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    // from_chars は '+' を受け付けない
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

GridGenerator::GridGenerator()
    : rng_(std::random_device{}()) {}

GridGenerator::GridGenerator(uint64_t seed)
    : rng_(seed) {}

Grid GridGenerator::generate(int64_t rows, int64_t cols,
                             Cell::value_type min, Cell::value_type max) {
    if (rows <= 0 || cols <= 0) {
        throw InvalidDimension("rows and cols must be positive integers (got " +
                               std::to_string(rows) + "x" + std::to_string(cols) + ")");
    }
    if (min > max) {
        std::swap(min, max);
    }

    std::uniform_int_distribution<Cell::value_type> dist(min, max);
    Grid grid;
    grid.reserve(static_cast<size_t>(rows));
    for (int64_t r = 0; r < rows; ++r) {
        Row row;
        row.reserve(static_cast<size_t>(cols));
        for (int64_t c = 0; c < cols; ++c) {
            row.emplace_back(dist(rng_));
        }
        grid.push_back(std::move(row));
    }
    return grid;
}

Grid generate(int64_t rows, int64_t cols, Cell::value_type min, Cell::value_type max) {
    GridGenerator generator;
    return generator.generate(rows, cols, min, max);
}

int64_t parse_dimension(const std::string& text) {
    int64_t value = 0;
    if (!parse_int64(text, value)) {
        throw InvalidDimension("dimension must be an integer: " + text);
    }
    if (value <= 0) {
        throw InvalidDimension("dimension must be positive: " + text);
    }
    return value;
}

Cell::value_type parse_bound(const std::string& text) {
    int64_t value = 0;
    if (!parse_int64(text, value)) {
        throw std::invalid_argument("bound must be an integer: " + text);
    }
    return value;
}

uint64_t parse_seed(const std::string& text) {
    uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw std::invalid_argument("seed must be an unsigned integer: " + text);
    }
    return value;
}

} // namespace sign_grid
