#include <catch2/catch_test_macros.hpp>
#include "sign_grid/cell.hpp"
#include <cmath>
#include <limits>

using namespace sign_grid;

// ============================================================================
// Cell tests
// ============================================================================

TEST_CASE("Cell sign classification", "[cell]") {
    SECTION("integers") {
        REQUIRE(Cell(5).sign() == Sign::Positive);
        REQUIRE(Cell(-5).sign() == Sign::Negative);
        REQUIRE(Cell(0).sign() == Sign::Neutral);
    }

    SECTION("reals") {
        REQUIRE(Cell(0.5).sign() == Sign::Positive);
        REQUIRE(Cell(-0.5).sign() == Sign::Negative);
        REQUIRE(Cell(-0.0).sign() == Sign::Neutral);
    }

    SECTION("neutral kinds") {
        REQUIRE(Cell().sign() == Sign::Neutral);
        REQUIRE(Cell(std::string("abc")).sign() == Sign::Neutral);
        REQUIRE(Cell(std::numeric_limits<double>::quiet_NaN()).sign() == Sign::Neutral);
    }
}

TEST_CASE("Cell numeric value", "[cell]") {
    REQUIRE(Cell(7).numeric().value() == 7.0);
    REQUIRE(Cell(-2.5).numeric().value() == -2.5);
    REQUIRE(!Cell().numeric());
    REQUIRE(!Cell(std::string("7")).numeric());
    REQUIRE(!Cell(std::numeric_limits<double>::quiet_NaN()).numeric());
}

TEST_CASE("Cell display text", "[cell]") {
    REQUIRE(Cell(-42).to_string() == "-42");
    REQUIRE(Cell(2.5).to_string() == "2.5");
    REQUIRE(Cell(3.0).to_string() == "3");
    REQUIRE(Cell(std::numeric_limits<double>::quiet_NaN()).to_string() == "NaN");
    REQUIRE(Cell(std::numeric_limits<double>::infinity()).to_string() == "Infinity");
    REQUIRE(Cell(std::string("abc")).to_string() == "abc");
    REQUIRE(Cell().to_string() == EMPTY_CELL);
}

TEST_CASE("format_number", "[cell]") {
    REQUIRE(format_number(-5.0) == "-5");
    REQUIRE(format_number(0.1) == "0.1");
    REQUIRE(format_number(-0.0) == "0");
    REQUIRE(format_number(-std::numeric_limits<double>::infinity()) == "-Infinity");
}

TEST_CASE("cell_at on ragged rows", "[cell]") {
    Grid grid = {{1, 2, 3}, {4}};

    REQUIRE(max_row_length(grid) == 3);
    REQUIRE(cell_at(grid[0], 2).value() == Cell(3));
    REQUIRE(cell_at(grid[1], 0).value() == Cell(4));
    REQUIRE(!cell_at(grid[1], 1));
    REQUIRE(!cell_at(grid[1], 2));

    SECTION("present missing cell is not absent") {
        Row row = {1, Cell(), 2};
        auto cell = cell_at(row, 1);
        REQUIRE(cell.has_value());
        REQUIRE(cell->is_missing());
    }
}
