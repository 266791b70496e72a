#include <catch2/catch_test_macros.hpp>
#include "sign_grid/renderer.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace sign_grid;

// ============================================================================
// Table renderer tests
// ============================================================================

namespace {

std::string render_to_string(const Grid& grid, bool use_colors) {
    std::ostringstream out;
    RenderOptions options;
    options.use_colors = use_colors;
    render(grid, options, out);
    return out.str();
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST_CASE("render empty grid", "[renderer]") {
    REQUIRE(render_to_string(Grid{}, false) == "Grid is empty.\n");
    REQUIRE(render_to_string(Grid{}, true) == "Grid is empty.\n");
}

TEST_CASE("render plain table", "[renderer]") {
    Grid grid = {{3, 3, 3, -1}, {5, -5, 5}};

    std::string expected =
        "\n"
        "      |   c0   c1   c2   c3 | minPos | replace\n"
        "----------------------------------------------\n"
        "  r 0 |    3    3    3   -1 |      3 |       1\n"
        "* r 1 |    5   -5    5    \xE2\x80\x94 |      5 |       0\n"
        "----------------------------------------------\n"
        "Global minimum: -5 found at positions: (r1,c1)\n"
        "\n";

    REQUIRE(render_to_string(grid, false) == expected);
}

TEST_CASE("render keeps every table line the same width", "[renderer]") {
    Grid grid = {{-100, 2}, {}, {Cell(), 2.5, Cell(std::string("text")), 7}, {-100}};

    for (bool colors : {false, true}) {
        auto lines = split_lines(render_to_string(grid, colors));
        // blank, header, separator, 4 rows, separator, summary, blank
        REQUIRE(lines.size() == 10);
        size_t width = display_cols(lines[1]);
        for (size_t i = 2; i <= 7; ++i) {
            REQUIRE(display_cols(lines[i]) == width);
        }
    }
}

TEST_CASE("render marks rows and lists every minimum position", "[renderer]") {
    Grid grid = {{5, 1}, {1, 3}, {4, 4}};
    auto lines = split_lines(render_to_string(grid, false));

    REQUIRE(lines[3].rfind("* r 0", 0) == 0);
    REQUIRE(lines[4].rfind("* r 1", 0) == 0);
    REQUIRE(lines[5].rfind("  r 2", 0) == 0);
    REQUIRE(lines[7] == "Global minimum: 1 found at positions: (r0,c1), (r1,c0)");
}

TEST_CASE("render highlights minimum cells only with colors", "[renderer]") {
    Grid grid = {{3, -5}, {-5, 1}};
    const std::string highlighted = std::string(ansi::YELLOW_BG) + ansi::BOLD + "   -5" + ansi::RESET;

    SECTION("colors on") {
        auto text = render_to_string(grid, true);
        REQUIRE(text.find(highlighted) != std::string::npos);
        REQUIRE(text.find(std::string("Global minimum: ") + ansi::RED + "-5" + ansi::RESET) != std::string::npos);
    }

    SECTION("colors off") {
        auto text = render_to_string(grid, false);
        REQUIRE(text.find('\x1b') == std::string::npos);
        REQUIRE(text.find("Global minimum: -5 found at positions: (r0,c1), (r1,c0)") != std::string::npos);
    }
}

TEST_CASE("render without numeric cells", "[renderer]") {
    Grid grid = {{Cell(), Cell(std::string("x"))}};
    auto lines = split_lines(render_to_string(grid, true));

    REQUIRE(lines.size() == 7);
    REQUIRE(lines[5] == "Global minimum not found (no numeric values).");
    REQUIRE(lines[3].find('*') == std::string::npos);
}

TEST_CASE("column_width", "[renderer]") {
    REQUIRE(column_width(Grid{{1, -2}}) == 5);
    REQUIRE(column_width(Grid{{-12345, 0}}) == 7);
    REQUIRE(column_width(Grid{{Cell(std::string("abcdefgh"))}}) == 9);
    REQUIRE(column_width(Grid{{Cell()}}) == 5);
}

TEST_CASE("min_positive", "[renderer]") {
    REQUIRE(min_positive({-3, 4, 2, 0}).value() == Cell(2));
    REQUIRE(min_positive({0.5, 3}).value() == Cell(0.5));
    REQUIRE(min_positive({Cell(Cell::value_type{9007199254740993}), Cell(Cell::value_type{9007199254740992})}).value()
            == Cell(Cell::value_type{9007199254740992}));
    REQUIRE(!min_positive({-3, 0, Cell()}));
    REQUIRE(!min_positive(Row{}));
}

TEST_CASE("display_cols and pad_left", "[renderer]") {
    REQUIRE(display_cols("abc") == 3);
    REQUIRE(display_cols(EMPTY_CELL) == 1);
    REQUIRE(display_cols(std::string(ansi::RED) + "-5" + ansi::RESET) == 2);

    REQUIRE(pad_left("7", 4) == "   7");
    REQUIRE(pad_left(EMPTY_CELL, 3) == std::string("  ") + EMPTY_CELL);
    REQUIRE(pad_left("toolong", 3) == "toolong");
}

TEST_CASE("render prints the exact minimum of large integers", "[renderer]") {
    const Cell::value_type lowest = -9223372036854775807;
    Grid grid = {{Cell(lowest), 1}, {Cell(lowest + 1), 2}};
    auto lines = split_lines(render_to_string(grid, false));

    REQUIRE(lines[3].rfind("* r 0", 0) == 0);
    REQUIRE(lines[4].rfind("  r 1", 0) == 0);
    REQUIRE(lines[6] == "Global minimum: -9223372036854775807 found at positions: (r0,c0)");
}
