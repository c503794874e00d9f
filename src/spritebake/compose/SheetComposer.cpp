#include "spritebake/compose/SheetComposer.hpp"
#include "spritebake/core/Errors.hpp"

#include <string>

namespace spritebake {

cv::Mat asRgbaMat(const Frame& f) {
    // No copy: the header references external bytes, valid while 'f' is
    return cv::Mat(static_cast<int>(f.height), static_cast<int>(f.width), CV_8UC4,
                   const_cast<std::uint8_t*>(f.data.data()));
}

cv::Mat mirroredCopy(const Frame& f) {
    cv::Mat out;
    cv::flip(asRgbaMat(f), out, 1); // 1 = around the vertical axis
    return out;
}

/*
  Sheet canvas:
    - size cols*W x rows*H, CV_8UC4, all channels zero (transparent);
    - row-major placement, left-to-right then top-to-bottom;
    - mirroring flips the frame content, never the cell position, so the
      frame order stays left-to-right.
*/
SheetComposer::SheetComposer(const GridLayout& layout, bool mirror)
    : layout_(layout), mirror_(mirror)
{
    if (layout_.rows < 1 || layout_.cols < 1 || layout_.cellWidth == 0 || layout_.cellHeight == 0) {
        throw ExportError(ErrorCode::GridTooSmall, "empty sheet layout");
    }
    canvas_ = cv::Mat::zeros(static_cast<int>(layout_.sheetHeight()),
                             static_cast<int>(layout_.sheetWidth()), CV_8UC4);
}

void SheetComposer::place(const Frame& f) {
    if (f.width != layout_.cellWidth || f.height != layout_.cellHeight || f.data.size() < f.bytes()) {
        throw ExportError(ErrorCode::Internal,
                          "frame " + std::to_string(f.index) + " does not match the cell size");
    }
    if (f.index < 0 || f.index >= layout_.capacity()) {
        throw ExportError(ErrorCode::GridTooSmall,
                          "frame " + std::to_string(f.index) + " outside the grid");
    }

    const int row = f.index / layout_.cols;
    const int col = f.index % layout_.cols;
    const cv::Rect cell(col * static_cast<int>(layout_.cellWidth),
                        row * static_cast<int>(layout_.cellHeight),
                        static_cast<int>(layout_.cellWidth),
                        static_cast<int>(layout_.cellHeight));

    if (mirror_) mirroredCopy(f).copyTo(canvas_(cell));
    else         asRgbaMat(f).copyTo(canvas_(cell));
    ++placed_;
}

ComposeResult SheetComposer::finish() {
    ComposeResult out{};
    out.sheetRgba = canvas_;
    out.layout    = layout_;
    out.placed    = placed_;
    return out;
}

ComposeResult composeSheet(const std::vector<FrameBuffer>& frames,
                           const GridLayout& layout,
                           bool mirror)
{
    if (static_cast<long long>(frames.size()) > layout.capacity()) {
        throw ExportError(ErrorCode::GridTooSmall,
                          std::to_string(frames.size()) + " frames for " +
                          std::to_string(layout.capacity()) + " cells");
    }
    SheetComposer sc(layout, mirror);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].index != static_cast<int>(i)) {
            throw ExportError(ErrorCode::Internal,
                              "frame sequence is not contiguous at position " + std::to_string(i));
        }
        sc.place(frames[i].view());
    }
    return sc.finish();
}

} // namespace spritebake
