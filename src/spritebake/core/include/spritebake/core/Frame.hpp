//====================================================================
// File: core/include/spritebake/core/Frame.hpp
//====================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace spritebake {

/// Bytes per pixel of every buffer in the pipeline (8-bit R,G,B,A).
inline constexpr std::size_t kRgbaChannels = 4;

/// Lightweight read-only view of one captured frame.
struct Frame {
    std::span<const std::uint8_t> data{}; ///< RGBA8, row-major, top row first
    std::uint32_t width{0};
    std::uint32_t height{0};
    int index{0};                         ///< position in the export range (0-based)

    [[nodiscard]] std::size_t bytes() const noexcept {
        return static_cast<std::size_t>(width) * height * kRgbaChannels;
    }
};

/// Owning RGBA8 raster produced by the renderer for one animation frame.
struct FrameBuffer {
    int index{0};
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::vector<std::uint8_t> rgba;

    FrameBuffer() = default;
    FrameBuffer(int idx, std::uint32_t w, std::uint32_t h)
        : index{idx}, width{w}, height{h},
          rgba(static_cast<std::size_t>(w) * h * kRgbaChannels, 0) {}

    [[nodiscard]] std::size_t bytes() const noexcept {
        return static_cast<std::size_t>(width) * height * kRgbaChannels;
    }

    /// Buffer holds exactly width*height RGBA pixels.
    [[nodiscard]] bool consistent() const noexcept {
        return width > 0 && height > 0 && rgba.size() == bytes();
    }

    [[nodiscard]] Frame view() const noexcept {
        return Frame{std::span<const std::uint8_t>(rgba.data(), rgba.size()),
                     width, height, index};
    }
};

} // namespace spritebake
