#pragma once
#include "spritebake/compose/GridLayout.hpp"
#include "spritebake/core/Frame.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace spritebake {

struct ComposeResult {
    cv::Mat    sheetRgba;   // CV_8UC4, RGBA order, transparent background
    GridLayout layout;
    int        placed{0};   // number of frames written into the canvas
};

/** Wrap a frame's RGBA bytes as a CV_8UC4 header (no copy). */
cv::Mat asRgbaMat(const Frame& f);

/** Copy of the frame mirrored about its vertical center axis. */
cv::Mat mirroredCopy(const Frame& f);

/**
 * Incremental sheet builder.
 * Frame i goes to cell (i / cols, i % cols), top-left at (col*W, row*H).
 * Unused cells stay fully transparent. Alpha is copied verbatim.
 */
class SheetComposer {
public:
    SheetComposer(const GridLayout& layout, bool mirror);

    /// place one frame; its size must match the layout cell size
    void place(const Frame& f);

    [[nodiscard]] const cv::Mat& canvas() const noexcept { return canvas_; }
    [[nodiscard]] int placed() const noexcept { return placed_; }

    ComposeResult finish();

private:
    GridLayout layout_;
    bool       mirror_;
    cv::Mat    canvas_;
    int        placed_{0};
};

/** Compose a whole sheet from buffers ordered by index 0..n-1. */
ComposeResult composeSheet(const std::vector<FrameBuffer>& frames,
                           const GridLayout& layout,
                           bool mirror);

} // namespace spritebake
