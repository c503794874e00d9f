#include "spritebake/compose/SheetComposer.hpp"
#include "spritebake/core/Errors.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cstring>

using namespace spritebake;

namespace {

/* Frame whose pixel (x,y) is (index, x, y, alpha). */
FrameBuffer patterned(int index, std::uint32_t w, std::uint32_t h, std::uint8_t alpha = 255) {
    FrameBuffer fb(index, w, h);
    for (std::uint32_t y = 0; y < h; ++y) {
        for (std::uint32_t x = 0; x < w; ++x) {
            std::uint8_t* p = &fb.rgba[(static_cast<std::size_t>(y) * w + x) * kRgbaChannels];
            p[0] = static_cast<std::uint8_t>(index);
            p[1] = static_cast<std::uint8_t>(x);
            p[2] = static_cast<std::uint8_t>(y);
            p[3] = alpha;
        }
    }
    return fb;
}

cv::Vec4b px(const cv::Mat& m, int x, int y) { return m.at<cv::Vec4b>(y, x); }

std::vector<FrameBuffer> frames(int n, std::uint32_t w, std::uint32_t h) {
    std::vector<FrameBuffer> v;
    for (int i = 0; i < n; ++i) v.push_back(patterned(i, w, h));
    return v;
}

} // namespace

TEST(SheetComposer, SingleFrameSheetEqualsFrame) {
    const FrameBuffer fb = patterned(0, 64, 48, 200);
    const auto layout = solveGrid(1, std::nullopt, 64, 48);
    const auto r = composeSheet({fb}, layout, false);

    ASSERT_EQ(r.sheetRgba.cols, 64);
    ASSERT_EQ(r.sheetRgba.rows, 48);
    ASSERT_TRUE(r.sheetRgba.isContinuous());
    EXPECT_EQ(std::memcmp(r.sheetRgba.data, fb.rgba.data(), fb.rgba.size()), 0);
    EXPECT_EQ(r.placed, 1);
}

TEST(SheetComposer, RowMajorPlacement) {
    const auto layout = solveGrid(5, std::nullopt, 8, 4);    // 3 cols x 2 rows
    ASSERT_EQ(layout.cols, 3);
    const auto r = composeSheet(frames(5, 8, 4), layout, false);

    EXPECT_EQ(r.sheetRgba.cols, 24);
    EXPECT_EQ(r.sheetRgba.rows, 8);
    for (int i = 0; i < 5; ++i) {
        const int x0 = (i % 3) * 8, y0 = (i / 3) * 4;
        EXPECT_EQ(px(r.sheetRgba, x0, y0),         (cv::Vec4b(i, 0, 0, 255))) << i;
        EXPECT_EQ(px(r.sheetRgba, x0 + 7, y0 + 3), (cv::Vec4b(i, 7, 3, 255))) << i;
    }
}

TEST(SheetComposer, UnusedCellsAreTransparent) {
    const auto layout = solveGrid(10, std::nullopt, 4, 4);   // 4x3, two empty
    const auto r = composeSheet(frames(10, 4, 4), layout, false);

    const cv::Mat lastTwo = r.sheetRgba(cv::Rect(2 * 4, 2 * 4, 8, 4));
    EXPECT_EQ(cv::countNonZero(lastTwo.reshape(1)), 0);
}

TEST(SheetComposer, AlphaIsCopiedVerbatim) {
    std::vector<FrameBuffer> v{patterned(0, 4, 4, 0), patterned(1, 4, 4, 17), patterned(2, 4, 4, 255)};
    const auto r = composeSheet(v, GridLayout{1, 3, 4, 4}, false);
    EXPECT_EQ(px(r.sheetRgba, 1, 1)[3], 0);
    EXPECT_EQ(px(r.sheetRgba, 1, 1)[1], 1);   // color kept under zero alpha
    EXPECT_EQ(px(r.sheetRgba, 5, 1)[3], 17);
    EXPECT_EQ(px(r.sheetRgba, 9, 1)[3], 255);
}

TEST(SheetComposer, MirrorFlipsEachCellInPlace) {
    const auto layout = solveGrid(4, std::nullopt, 6, 3);
    const auto v = frames(4, 6, 3);
    const auto plain    = composeSheet(v, layout, false);
    const auto mirrored = composeSheet(v, layout, true);

    ASSERT_EQ(plain.sheetRgba.size(), mirrored.sheetRgba.size());
    for (int i = 0; i < 4; ++i) {
        const cv::Rect cell((i % layout.cols) * 6, (i / layout.cols) * 3, 6, 3);
        cv::Mat flipped;
        cv::flip(plain.sheetRgba(cell), flipped, 1);
        const cv::Mat diff = flipped != mirrored.sheetRgba(cell);
        EXPECT_EQ(cv::countNonZero(diff.reshape(1)), 0) << "cell " << i;
    }
    // leftmost column of a mirrored cell holds the unmirrored rightmost column
    EXPECT_EQ(px(mirrored.sheetRgba, 0, 0), (cv::Vec4b(0, 5, 0, 255)));
}

TEST(SheetComposer, MismatchedFrameSizeIsRejected) {
    SheetComposer sc(GridLayout{1, 2, 8, 8}, false);
    const FrameBuffer small = patterned(0, 4, 8);
    EXPECT_THROW(sc.place(small.view()), ExportError);
    EXPECT_EQ(sc.placed(), 0);
}

TEST(SheetComposer, IndexOutsideGridIsRejected) {
    SheetComposer sc(GridLayout{1, 2, 4, 4}, false);
    const FrameBuffer third = patterned(2, 4, 4);
    try {
        sc.place(third.view());
        FAIL() << "expected GridTooSmall";
    } catch (const ExportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::GridTooSmall);
    }
}

TEST(SheetComposer, TooManyFramesForLayout) {
    try {
        (void)composeSheet(frames(5, 4, 4), GridLayout{2, 2, 4, 4}, false);
        FAIL() << "expected GridTooSmall";
    } catch (const ExportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::GridTooSmall);
    }
}

TEST(SheetComposer, GapInSequenceIsRejected) {
    auto v = frames(3, 4, 4);
    v[1].index = 2;
    EXPECT_THROW((void)composeSheet(v, GridLayout{2, 2, 4, 4}, false), ExportError);
}
