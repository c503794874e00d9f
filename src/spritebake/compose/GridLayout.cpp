#include "spritebake/compose/GridLayout.hpp"
#include "spritebake/core/Errors.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace spritebake {

int ceilSqrt(int n) {
    if (n <= 0) return 0;
    // start from the float estimate and fix it up, sqrt() may be off by one
    auto c = static_cast<long long>(std::sqrt(static_cast<double>(n)));
    while (c * c < n) ++c;
    while (c > 1 && (c - 1) * (c - 1) >= n) --c;
    return static_cast<int>(c);
}

/*
  Auto layout minimises wasted cells first and |rows - cols| second.
  cols = ceil(sqrt(n)) gives rows in {cols-1, cols}; no square or
  near-square grid with a smaller area can hold n frames.
*/
GridLayout solveGrid(int frameCount,
                     const std::optional<GridOverride>& manual,
                     std::uint32_t cellWidth,
                     std::uint32_t cellHeight)
{
    if (frameCount < 1) {
        throw ExportError(ErrorCode::InvalidFrameRange,
                          "frame count " + std::to_string(frameCount) + " < 1");
    }

    GridLayout g{};
    g.cellWidth  = cellWidth;
    g.cellHeight = cellHeight;

    if (manual) {
        const long long cells = static_cast<long long>(manual->rows) * manual->cols;
        if (manual->rows < 1 || manual->cols < 1 || cells < frameCount) {
            throw ExportError(ErrorCode::GridTooSmall,
                              std::to_string(manual->rows) + "x" + std::to_string(manual->cols) +
                              " grid cannot hold " + std::to_string(frameCount) + " frames");
        }
        g.rows = manual->rows;
        g.cols = manual->cols;
    } else {
        g.cols = ceilSqrt(frameCount);
        g.rows = static_cast<int>((static_cast<long long>(frameCount) + g.cols - 1) / g.cols);
    }

    // cell count and canvas sides must stay addressable as int (cv::Mat)
    constexpr long long kLimit = std::numeric_limits<int>::max();
    const long long cells   = static_cast<long long>(g.rows) * g.cols;
    const long long sheetW  = static_cast<long long>(g.cols) * cellWidth;
    const long long sheetH  = static_cast<long long>(g.rows) * cellHeight;
    if (cells > kLimit || sheetW > kLimit || sheetH > kLimit) {
        throw ExportError(ErrorCode::InvalidFrameSize,
                          std::to_string(g.rows) + "x" + std::to_string(g.cols) + " grid of " +
                          std::to_string(cellWidth) + "x" + std::to_string(cellHeight) +
                          " cells is too large (" + std::to_string(sheetW) + "x" +
                          std::to_string(sheetH) + " px)");
    }
    return g;
}

} // namespace spritebake
