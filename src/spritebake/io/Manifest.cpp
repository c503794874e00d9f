#include "spritebake/io/Manifest.hpp"
#include "spritebake/compose/GridLayout.hpp"
#include "spritebake/core/Config.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#ifndef SPRITEBAKE_VERSION
#define SPRITEBAKE_VERSION "dev"
#endif

namespace spritebake {

std::string utcTimestamp(std::chrono::system_clock::time_point when) {
    const std::time_t secs = std::chrono::system_clock::to_time_t(when);
    std::tm parts{};
    if (!gmtime_r(&secs, &parts)) return "1970-01-01T00:00:00Z";
    char buf[32];
    const std::size_t len = std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%SZ", &parts);
    return std::string(buf, len);
}

std::string jsonQuoted(std::string_view text) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (const char ch : text) {
        const auto u = static_cast<unsigned char>(ch);
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
            out.push_back(ch);
        } else if (ch == '\n') {
            out += "\\n";
        } else if (ch == '\t') {
            out += "\\t";
        } else if (ch == '\r') {
            out += "\\r";
        } else if (u < 0x20) {
            out += "\\u00";
            out.push_back(kHex[u >> 4]);
            out.push_back(kHex[u & 0x0F]);
        } else {
            out.push_back(ch);   // UTF-8 bytes pass through
        }
    }
    out.push_back('"');
    return out;
}

/* One pass over the file: SHA-256 through EVP and zlib CRC32. */
Artifact describeFile(const std::filesystem::path& p, const std::string& kind) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot read " + p.string());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 init failed");
    }

    std::vector<unsigned char> buf(1<<20);
    uLong crc = crc32(0L, Z_NULL, 0);
    while (f) {
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = f.gcount();
        if (got <= 0) break;
        EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got));
        crc = crc32(crc, buf.data(), static_cast<uInt>(got));
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    EVP_DigestFinal_ex(ctx.get(), md, &mdLen);

    Artifact a;
    a.path = p.string();
    a.size = std::filesystem::file_size(p);
    a.kind = kind;

    std::ostringstream sha;
    sha << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < mdLen; ++i) sha << std::setw(2) << static_cast<int>(md[i]);
    a.sha256 = sha.str();

    std::ostringstream c;
    c << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << static_cast<std::uint32_t>(crc);
    a.crc32 = c.str();
    return a;
}

std::string buildManifestJson(const ExportJob& job,
                              const GridLayout& layout,
                              int frameCount,
                              const std::vector<Artifact>& artifacts)
{
    std::ostringstream j;
    j << "{\n";
    j << "  \"manifest_version\": \"1\",\n";
    j << "  \"software\": { \"spritebake_version\": \"" << SPRITEBAKE_VERSION << "\" },\n";
    j << "  \"created_at\": " << jsonQuoted(utcTimestamp(std::chrono::system_clock::now())) << ",\n";
    j << "  \"job\": {\n";
    j << "    \"name\": " << jsonQuoted(job.name) << ",\n";
    j << "    \"frame_size\": [" << job.frameWidth << ", " << job.frameHeight << "],\n";
    j << "    \"frame_range\": [" << job.frameStart << ", " << job.frameEnd << "],\n";
    j << "    \"frame_step\": " << job.frameStep << ",\n";
    j << "    \"angle\": \"" << toString(job.angle) << "\",\n";
    j << "    \"projection\": \"" << toString(job.projection) << "\",\n";
    j << "    \"padding\": " << job.padding << ",\n";
    j << "    \"mirror\": " << (job.mirror ? "true" : "false") << ",\n";
    j << "    \"format\": \"" << toString(job.format) << "\",\n";
    j << "    \"mode\": \"" << toString(job.mode) << "\"\n";
    j << "  },\n";
    j << "  \"frames\": " << frameCount << ",\n";
    j << "  \"grid\": { \"rows\": " << layout.rows << ", \"cols\": " << layout.cols
      << ", \"cell\": [" << layout.cellWidth << ", " << layout.cellHeight << "] },\n";
    j << "  \"artifacts\": [\n";
    for (std::size_t i = 0; i < artifacts.size(); ++i) {
        const auto& a = artifacts[i];
        j << "    {\"path\":" << jsonQuoted(a.path) << ","
          << "\"size\":" << a.size << ","
          << "\"sha256\":\"" << a.sha256 << "\","
          << "\"crc32\":\"" << a.crc32 << "\","
          << "\"kind\":\"" << a.kind << "\"}"
          << (i + 1 < artifacts.size() ? ",\n" : "\n");
    }
    j << "  ]\n";
    j << "}\n";
    return j.str();
}

} // namespace spritebake
