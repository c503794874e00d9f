#pragma once

#include <filesystem>
#include <random>
#include <string>

namespace spritebake::test {

/* Fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    TempDir() {
        std::mt19937_64 rng{std::random_device{}()};
        path_ = std::filesystem::temp_directory_path() /
                ("spritebake-test-" + std::to_string(rng()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /* Number of regular files below the directory. */
    std::size_t fileCount() const {
        std::size_t n = 0;
        for (const auto& e : std::filesystem::recursive_directory_iterator(path_)) {
            if (e.is_regular_file()) ++n;
        }
        return n;
    }

private:
    std::filesystem::path path_;
};

} // namespace spritebake::test
