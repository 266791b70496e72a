#include "sign_grid/sign_run.hpp"

namespace sign_grid {

std::vector<SignRun> sign_runs(const Row& row) {
    std::vector<SignRun> runs;

    // 符号はセルごとに1回だけ計算する
    std::vector<Sign> signs;
    signs.reserve(row.size());
    for (const auto& cell : row) {
        signs.push_back(cell.sign());
    }

    size_t i = 0;
    const size_t n = signs.size();
    while (i < n) {
        Sign current = signs[i];
        if (current == Sign::Neutral) {
            ++i;
            continue;
        }
        size_t begin = i;
        while (i < n && signs[i] == current) {
            ++i;
        }
        runs.push_back({begin, i - begin, current});
    }
    return runs;
}

size_t min_replacements(const Row& row) {
    size_t replacements = 0;
    for (const auto& run : sign_runs(row)) {
        if (run.length >= 3) {
            replacements += run.length / 3;
        }
    }
    return replacements;
}

} // namespace sign_grid
