#include "spritebake/io/FrameStore.hpp"
#include "spritebake/core/Errors.hpp"

#include <zlib.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <system_error>

namespace spritebake {

namespace {
#pragma pack(push, 1)
struct RecordHeader {
    char     magic[4];      // 'S','B','F','1'
    uint32_t version;       // 1
    int32_t  index;
    uint32_t width;
    uint32_t height;
    uint32_t crc32;
    uint64_t data_size;
};
#pragma pack(pop)

static_assert(sizeof(RecordHeader) == 32, "RecordHeader size unexpected");

std::uint32_t crc32_bytes(const void* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}

std::filesystem::path recordName(int index) {
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%06d.sbf", index);
    return name;
}
} // namespace

std::string makeJobId() {
    std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> d;
    std::ostringstream os;
    os << std::hex << d(rng);
    return os.str();
}

FrameStore::FrameStore(const std::filesystem::path& root,
                       const std::string& jobId,
                       std::uintmax_t budgetBytes)
    : dir_(root / ("spritebake-" + jobId))
    , budget_(budgetBytes)
{
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw ExportError(ErrorCode::StorageExhausted,
                          "cannot create " + dir_.string() + ": " + ec.message());
    }
}

void FrameStore::put(const FrameBuffer& fb)
{
    if (!fb.consistent()) {
        throw ExportError(ErrorCode::Internal,
                          "frame " + std::to_string(fb.index) + " buffer size mismatch");
    }

    const std::uintmax_t need = sizeof(RecordHeader) + fb.rgba.size();
    if (used_ + need > budget_) {
        throw ExportError(ErrorCode::StorageExhausted,
                          "temporary budget of " + std::to_string(budget_) + " bytes exceeded at frame " +
                          std::to_string(fb.index));
    }

    std::error_code ec;
    const auto sp = std::filesystem::space(dir_, ec);
    if (!ec && sp.available < need) {
        throw ExportError(ErrorCode::StorageExhausted,
                          "disk full in " + dir_.string() + " at frame " + std::to_string(fb.index));
    }

    RecordHeader rh{};
    std::memcpy(rh.magic, "SBF1", 4);
    rh.version   = 1u;
    rh.index     = fb.index;
    rh.width     = fb.width;
    rh.height    = fb.height;
    rh.crc32     = crc32_bytes(fb.rgba.data(), fb.rgba.size());
    rh.data_size = fb.rgba.size();

    // write to *.part first so a failed write never looks like a record
    const auto final_path = dir_ / recordName(fb.index);
    auto part_path = final_path;
    part_path += ".part";

    bool ok = false;
    {
        std::ofstream ofs(part_path, std::ios::binary | std::ios::trunc);
        if (ofs) {
            ofs.write(reinterpret_cast<const char*>(&rh), sizeof(rh));
            ofs.write(reinterpret_cast<const char*>(fb.rgba.data()),
                      static_cast<std::streamsize>(fb.rgba.size()));
            ofs.flush();
            ok = static_cast<bool>(ofs);
        }
    }
    if (ok) {
        std::filesystem::rename(part_path, final_path, ec);
        ok = !ec;
    }
    if (!ok) {
        std::filesystem::remove(part_path, ec);
        throw ExportError(ErrorCode::StorageExhausted,
                          "failed to write temporary frame " + std::to_string(fb.index) +
                          " to " + dir_.string());
    }

    auto [it, inserted] = files_.insert_or_assign(fb.index, final_path);
    (void)it;
    if (inserted) used_ += need;
}

FrameBuffer FrameStore::load(int index) const
{
    const auto it = files_.find(index);
    if (it == files_.end()) {
        throw ExportError(ErrorCode::Internal, "no stored frame " + std::to_string(index));
    }

    std::ifstream ifs(it->second, std::ios::binary);
    RecordHeader rh{};
    ifs.read(reinterpret_cast<char*>(&rh), sizeof(rh));
    if (!ifs || std::memcmp(rh.magic, "SBF1", 4) != 0 || rh.version != 1u || rh.index != index ||
        rh.data_size != static_cast<std::uint64_t>(rh.width) * rh.height * kRgbaChannels) {
        throw ExportError(ErrorCode::Internal, "corrupt temporary frame " + it->second.string());
    }

    FrameBuffer fb(index, rh.width, rh.height);
    ifs.read(reinterpret_cast<char*>(fb.rgba.data()), static_cast<std::streamsize>(fb.rgba.size()));
    if (!ifs || crc32_bytes(fb.rgba.data(), fb.rgba.size()) != rh.crc32) {
        throw ExportError(ErrorCode::Internal, "CRC mismatch in temporary frame " + it->second.string());
    }
    return fb;
}

namespace {

/* Cleanup runs from noexcept paths: a failing log write must not escape. */
void reportRemoveFailure(const std::filesystem::path& p, const std::error_code& ec) noexcept {
    try {
        std::cerr << "[cleanup] cannot remove " << p.string() << ": " << ec.message() << "\n";
    } catch (const std::exception&) {
        // nothing left to report to
    }
}

} // namespace

int FrameStore::removeAll() noexcept
{
    int failures = 0;
    std::error_code ec;
    for (const auto& [index, path] : files_) {
        std::filesystem::remove(path, ec);
        if (ec) {
            reportRemoveFailure(path, ec);
            ++failures;
        }
    }
    files_.clear();
    used_ = 0;

    // the error_code overload of remove_all may still throw bad_alloc
    try {
        std::filesystem::remove_all(dir_, ec);
    } catch (const std::exception&) {
        ec = std::make_error_code(std::errc::not_enough_memory);
    }
    if (ec) {
        reportRemoveFailure(dir_, ec);
        ++failures;
    }
    return failures;
}

} // namespace spritebake
