#pragma once

#include "spritebake/core/Config.hpp"

#include <cstdint>
#include <optional>

namespace spritebake {

/** Sprite sheet grid: rows x cols cells of cellWidth x cellHeight pixels. */
struct GridLayout {
    int rows{1};
    int cols{1};
    std::uint32_t cellWidth{0};
    std::uint32_t cellHeight{0};

    [[nodiscard]] int capacity() const noexcept { return rows * cols; }
    [[nodiscard]] std::uint32_t sheetWidth()  const noexcept { return static_cast<std::uint32_t>(cols) * cellWidth; }
    [[nodiscard]] std::uint32_t sheetHeight() const noexcept { return static_cast<std::uint32_t>(rows) * cellHeight; }

    friend bool operator==(const GridLayout&, const GridLayout&) = default;
};

/** Smallest c with c*c >= n (integer, no floating point). */
int ceilSqrt(int n);

/**
 * Grid for 'frameCount' frames.
 *   - manual: validated, rows*cols must hold every frame (GridTooSmall).
 *   - auto  : cols = ceil(sqrt(n)), rows = ceil(n / cols).
 * frameCount < 1 fails with InvalidFrameRange. A grid whose cell count or
 * sheet side does not fit in an int fails with InvalidFrameSize.
 */
GridLayout solveGrid(int frameCount,
                     const std::optional<GridOverride>& manual = std::nullopt,
                     std::uint32_t cellWidth = 0,
                     std::uint32_t cellHeight = 0);

} // namespace spritebake
