#include "spritebake/io/FrameStore.hpp"
#include "spritebake/core/Errors.hpp"
#include "TempDir.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <utility>

using namespace spritebake;
using spritebake::test::TempDir;

namespace {
FrameBuffer filled(int index, std::uint32_t w, std::uint32_t h, std::uint8_t v) {
    FrameBuffer fb(index, w, h);
    for (std::size_t i = 0; i < fb.rgba.size(); ++i) fb.rgba[i] = static_cast<std::uint8_t>(v + i);
    return fb;
}

constexpr std::uintmax_t kHeader = 32;
} // namespace

TEST(FrameStore, StoresAndLoadsFrames) {
    TempDir tmp;
    FrameStore store(tmp.path(), "t1", 1 << 20);
    store.put(filled(0, 8, 4, 1));
    store.put(filled(1, 8, 4, 9));

    EXPECT_EQ(store.count(), 2u);
    EXPECT_TRUE(store.contains(1));
    EXPECT_FALSE(store.contains(2));
    EXPECT_EQ(store.bytesUsed(), 2 * (kHeader + 8 * 4 * 4));

    const FrameBuffer back = store.load(1);
    EXPECT_EQ(back.index, 1);
    EXPECT_EQ(back.width, 8u);
    EXPECT_EQ(back.height, 4u);
    EXPECT_EQ(back.rgba, filled(1, 8, 4, 9).rgba);
}

TEST(FrameStore, DirectoryIsNamespacedByJob) {
    TempDir tmp;
    FrameStore a(tmp.path(), "aaa", 1 << 20);
    FrameStore b(tmp.path(), "bbb", 1 << 20);
    EXPECT_NE(a.directory(), b.directory());
    EXPECT_EQ(a.directory().parent_path(), tmp.path());
}

TEST(FrameStore, JobIdsDiffer) {
    EXPECT_NE(makeJobId(), makeJobId());
}

TEST(FrameStore, BudgetIsEnforced) {
    TempDir tmp;
    const std::uintmax_t one = kHeader + 8 * 8 * 4;
    FrameStore store(tmp.path(), "budget", 2 * one);
    store.put(filled(0, 8, 8, 0));
    store.put(filled(1, 8, 8, 0));
    try {
        store.put(filled(2, 8, 8, 0));
        FAIL() << "expected StorageExhausted";
    } catch (const ExportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StorageExhausted);
    }
    EXPECT_EQ(store.count(), 2u);
    EXPECT_FALSE(store.contains(2));
    // nothing but the two records on disk
    EXPECT_EQ(tmp.fileCount(), 2u);
}

TEST(FrameStore, InconsistentBufferIsRejected) {
    TempDir tmp;
    FrameStore store(tmp.path(), "bad", 1 << 20);
    FrameBuffer fb(0, 4, 4);
    fb.rgba.resize(3);
    EXPECT_THROW(store.put(fb), ExportError);
    EXPECT_EQ(store.count(), 0u);
}

TEST(FrameStore, CorruptedPayloadIsDetected) {
    TempDir tmp;
    FrameStore store(tmp.path(), "crc", 1 << 20);
    store.put(filled(0, 4, 4, 3));

    const auto rec = store.directory() / "frame_000000.sbf";
    ASSERT_TRUE(std::filesystem::exists(rec));
    {
        std::fstream f(rec, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(static_cast<std::streamoff>(kHeader + 5));
        const char junk = 0x5A;
        f.write(&junk, 1);
    }
    EXPECT_THROW((void)store.load(0), ExportError);
}

TEST(FrameStore, LoadingMissingFrameFails) {
    TempDir tmp;
    FrameStore store(tmp.path(), "missing", 1 << 20);
    EXPECT_THROW((void)store.load(3), ExportError);
}

TEST(FrameStore, RemoveAllDeletesRecordsAndDirectory) {
    TempDir tmp;
    FrameStore store(tmp.path(), "gone", 1 << 20);
    for (int i = 0; i < 5; ++i) store.put(filled(i, 4, 4, 0));
    const auto dir = store.directory();

    EXPECT_EQ(store.removeAll(), 0);
    EXPECT_EQ(store.count(), 0u);
    EXPECT_EQ(store.bytesUsed(), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir));
    // idempotent
    EXPECT_EQ(store.removeAll(), 0);
}

TEST(FrameStore, RemoveAllReportsFailuresWithoutThrowing) {
    static_assert(noexcept(std::declval<FrameStore&>().removeAll()));

    TempDir tmp;
    FrameStore store(tmp.path(), "stuck", 1 << 20);
    store.put(filled(0, 4, 4, 0));

    // swap the record for a non-empty directory so the per-record remove fails
    std::filesystem::path record;
    for (const auto& e : std::filesystem::directory_iterator(store.directory())) record = e.path();
    ASSERT_FALSE(record.empty());
    std::filesystem::remove(record);
    std::filesystem::create_directory(record);
    std::ofstream(record / "blocker") << "x";

    int failures = -1;
    EXPECT_NO_THROW(failures = store.removeAll());
    EXPECT_EQ(failures, 1);
    EXPECT_EQ(store.count(), 0u);
    // the recursive sweep of the job directory still clears it
    EXPECT_FALSE(std::filesystem::exists(store.directory()));
}
