#pragma once

#include "spritebake/core/Config.hpp"
#include "spritebake/core/Scene.hpp"
#include "spritebake/framing/CameraPlanner.hpp"
#include "spritebake/io/FrameStore.hpp"

#include <atomic>
#include <cstdint>
#include <functional>

namespace spritebake {

/// Set from any thread to stop an export between two frames.
using CancelToken = std::atomic<bool>;

enum class CaptureState : std::uint8_t {
    Idle = 0,
    Priming,
    Capturing,   // cursor() is the next frame to capture
    Drained,     // every frame stored
    Cancelled,
    Failed
};

const char* toString(CaptureState s) noexcept;

/*
  Sequential frame capture.

    Idle -> Priming -> Capturing(0) -> ... -> Capturing(n-1) -> Drained
                                   \-> Cancelled / Failed

  The camera is applied once in prime() and never touched again. Each step()
  sets scene time to frameStart + i, renders at the job frame size and stores
  the buffer under index i. The first render error aborts the job.
*/
class CaptureDriver {
public:
    using Progress = std::function<void(int done, int total)>;

    CaptureDriver(IAnimationSystem& anim,
                  IRenderer& renderer,
                  FrameStore& store,
                  const CameraPlan& plan,
                  const ExportJob& job);

    /// Idle -> Priming -> Capturing(0). Applies the camera exactly once.
    void prime();

    /// Capture frame cursor(). Returns false once Drained.
    /// Throws RenderFailed(i) / StorageExhausted and moves to Failed.
    bool step();

    /// prime() + step() until Drained. The token is polled between frames
    /// only; when set the driver moves to Cancelled and throws Cancelled.
    void run(const CancelToken* cancel = nullptr, const Progress& progress = {});

    [[nodiscard]] CaptureState state() const noexcept { return state_; }
    [[nodiscard]] int cursor() const noexcept { return cursor_; }
    [[nodiscard]] int total() const noexcept { return total_; }

private:
    IAnimationSystem& anim_;
    IRenderer&        renderer_;
    FrameStore&       store_;
    CameraPlan        plan_;
    const ExportJob&  job_;

    CaptureState state_{CaptureState::Idle};
    int cursor_{0};
    int total_{0};
};

} // namespace spritebake
