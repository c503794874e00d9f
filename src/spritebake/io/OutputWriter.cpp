#include "spritebake/io/OutputWriter.hpp"
#include "spritebake/core/Errors.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>

namespace spritebake {

std::string sanitizeName(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        switch (c) {
            case '|': case ':': case '*': case '?':
            case '<': case '>': case '"': case '/': case '\\':
                c = '_';
                break;
            default:
                break;
        }
    }
    if (out.empty()) out = "animation";
    return out;
}

int frameNumberWidth(int maxIndex) {
    int digits = 1;
    for (int v = std::max(0, maxIndex); v >= 10; v /= 10) ++digits;
    return std::max(4, digits);
}

std::string sheetFileName(const std::string& name, OutputFormat format) {
    return sanitizeName(name) + "_sheet." + extensionOf(format);
}

std::string frameFileName(const std::string& name, int index, int maxIndex, OutputFormat format) {
    char num[32];
    std::snprintf(num, sizeof(num), "%0*d", frameNumberWidth(maxIndex), index);
    return sanitizeName(name) + "_" + num + "." + extensionOf(format);
}

OutputSet::OutputSet(std::filesystem::path dir)
    : dir_(std::move(dir))
{
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw ExportError(ErrorCode::StorageExhausted,
                          "cannot create " + dir_.string() + ": " + ec.message());
    }
}

OutputSet::~OutputSet() {
    if (committed_) return;
    std::error_code ec;
    for (const auto& p : files_) {
        std::filesystem::remove(p, ec);
        if (ec) {
            std::cerr << "[output] cannot remove partial output " << p.string()
                      << ": " << ec.message() << "\n";
        }
    }
}

std::filesystem::path OutputSet::write(const std::string& fileName,
                                        const std::vector<std::uint8_t>& bytes)
{
    const auto path = dir_ / fileName;
    auto tmp = path;
    tmp += ".tmp";

    bool ok = false;
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (f) {
            f.write(reinterpret_cast<const char*>(bytes.data()),
                    static_cast<std::streamsize>(bytes.size()));
            f.flush();
            ok = static_cast<bool>(f);
        }
    }
    std::error_code ec;
    if (ok) {
        std::filesystem::rename(tmp, path, ec);
        ok = !ec;
    }
    if (!ok) {
        std::filesystem::remove(tmp, ec);
        throw ExportError(ErrorCode::StorageExhausted, "failed to write " + path.string());
    }
    files_.push_back(path);
    return files_.back();
}

} // namespace spritebake
