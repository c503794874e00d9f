#pragma once

#include "spritebake/core/Frame.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace spritebake {

// Temporary per-frame storage, one file per frame, binary format SBF1:
//
// Header (32 bytes):
//   char     magic[4] = 'S','B','F','1'
//   uint32_t version  = 1
//   int32_t  index          position in the export range
//   uint32_t width
//   uint32_t height
//   uint32_t crc32          zlib crc32 of the payload
//   uint64_t data_size      width*height*4
// Payload:
//   uint8_t  rgba[data_size]
//
// Little-endian (x86/amd64 layout).
//
// Files live in <root>/spritebake-<jobId>/, so jobs never collide.

class FrameStore {
public:
    /// Creates the job directory. Throws StorageExhausted if it cannot.
    FrameStore(const std::filesystem::path& root,
               const std::string& jobId,
               std::uintmax_t budgetBytes);

    /// Does not delete anything; see removeAll().
    ~FrameStore() = default;

    FrameStore(const FrameStore&)            = delete;
    FrameStore& operator=(const FrameStore&) = delete;

    /// Persist one buffer under its index. Over budget, out of disk space or
    /// any write error: StorageExhausted, and no partial record is left.
    void put(const FrameBuffer& fb);

    /// Read a stored frame back and verify its CRC.
    [[nodiscard]] FrameBuffer load(int index) const;

    [[nodiscard]] bool contains(int index) const { return files_.count(index) != 0; }
    [[nodiscard]] std::size_t count() const noexcept { return files_.size(); }
    [[nodiscard]] std::uintmax_t bytesUsed() const noexcept { return used_; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

    /// Remove every record and the job directory. Never throws; errors are
    /// logged and counted. Returns the number of removal failures.
    int removeAll() noexcept;

private:
    std::filesystem::path dir_;
    std::uintmax_t budget_;
    std::uintmax_t used_{0};
    std::map<int, std::filesystem::path> files_;
};

/// Random hex id for temp directory namespacing (not cryptographically secure).
std::string makeJobId();

} // namespace spritebake
