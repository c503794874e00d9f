#pragma once

#include "spritebake/core/Config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace spritebake {

/* Replace characters that are invalid in file names (| : * ? < > " / \) with '_'. */
std::string sanitizeName(const std::string& name);

/* Digits used for frame numbers: enough for 'maxIndex', at least 4. */
int frameNumberWidth(int maxIndex);

/* "<name>_sheet.<ext>" */
std::string sheetFileName(const std::string& name, OutputFormat format);

/* "<name>_<index>.<ext>", index zero padded to frameNumberWidth(maxIndex). */
std::string frameFileName(const std::string& name, int index, int maxIndex, OutputFormat format);

/*
  Set of output files of one job.
  Every file is written to "<path>.tmp" and renamed into place. Unless
  commit() is called, the destructor deletes every file written so far, so
  a failed job leaves no partial output behind.
*/
class OutputSet {
public:
    explicit OutputSet(std::filesystem::path dir);
    ~OutputSet();

    OutputSet(const OutputSet&)            = delete;
    OutputSet& operator=(const OutputSet&) = delete;

    /// Write bytes to dir/fileName. Throws StorageExhausted on I/O failure.
    std::filesystem::path write(const std::string& fileName,
                                const std::vector<std::uint8_t>& bytes);

    /// Keep the files.
    void commit() noexcept { committed_ = true; }

    [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

private:
    std::filesystem::path dir_;
    std::vector<std::filesystem::path> files_;
    bool committed_{false};
};

} // namespace spritebake
