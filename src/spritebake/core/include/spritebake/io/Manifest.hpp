#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace spritebake {

struct ExportJob;
struct GridLayout;

/* Artifact metadata for the export manifest.
   - path   : file path on disk
   - size   : file size in bytes
   - sha256 : SHA-256 hex (OpenSSL)
   - crc32  : CRC32 hex (zlib)
   - kind   : "sheet" or "frame" */
struct Artifact {
    std::string path;
    std::uintmax_t size{0};
    std::string sha256;
    std::string crc32;
    std::string kind;
};

/* "YYYY-MM-DDTHH:MM:SSZ" for a point in time. */
std::string utcTimestamp(std::chrono::system_clock::time_point when);

/* JSON string literal, quotes included. Control bytes become \u00XX. */
std::string jsonQuoted(std::string_view text);

/* Size, SHA-256 and CRC32 of a file. Throws std::runtime_error if unreadable. */
Artifact describeFile(const std::filesystem::path& p, const std::string& kind);

/* Manifest document for a finished job. */
std::string buildManifestJson(const ExportJob& job,
                              const GridLayout& layout,
                              int frameCount,
                              const std::vector<Artifact>& artifacts);

} // namespace spritebake
