#include "spritebake/capture/CaptureDriver.hpp"
#include "spritebake/core/Errors.hpp"

#include <string>

namespace spritebake {

const char* toString(CaptureState s) noexcept {
    switch (s) {
        case CaptureState::Idle:      return "Idle";
        case CaptureState::Priming:   return "Priming";
        case CaptureState::Capturing: return "Capturing";
        case CaptureState::Drained:   return "Drained";
        case CaptureState::Cancelled: return "Cancelled";
        case CaptureState::Failed:    return "Failed";
    }
    return "?";
}

CaptureDriver::CaptureDriver(IAnimationSystem& anim,
                             IRenderer& renderer,
                             FrameStore& store,
                             const CameraPlan& plan,
                             const ExportJob& job)
    : anim_(anim), renderer_(renderer), store_(store), plan_(plan), job_(job)
    , total_(job.frameCount()) {}

void CaptureDriver::prime() {
    if (state_ != CaptureState::Idle) {
        throw ExportError(ErrorCode::Internal,
                          std::string("prime() in state ") + toString(state_));
    }
    state_ = CaptureState::Priming;
    try {
        renderer_.setCamera(plan_.pose, plan_.projection);
    } catch (...) {
        state_ = CaptureState::Failed;
        throw;
    }
    cursor_ = 0;
    state_  = total_ > 0 ? CaptureState::Capturing : CaptureState::Drained;
}

bool CaptureDriver::step() {
    if (state_ == CaptureState::Drained) return false;
    if (state_ != CaptureState::Capturing) {
        throw ExportError(ErrorCode::Internal,
                          std::string("step() in state ") + toString(state_));
    }

    const int i = cursor_;
    try {
        anim_.setTime(job_.frameTime(i));

        FrameBuffer fb;
        const RenderStatus st = renderer_.render(job_.frameWidth, job_.frameHeight, fb);
        if (!st.ok) {
            throw ExportError::renderFailed(i, st.message.empty() ? "renderer error" : st.message);
        }
        if (fb.width != job_.frameWidth || fb.height != job_.frameHeight || !fb.consistent()) {
            throw ExportError::renderFailed(i,
                "renderer returned " + std::to_string(fb.width) + "x" + std::to_string(fb.height) +
                ", expected " + std::to_string(job_.frameWidth) + "x" + std::to_string(job_.frameHeight));
        }
        fb.index = i;
        store_.put(fb);
    } catch (const ExportError&) {
        state_ = CaptureState::Failed;
        throw;
    } catch (const std::exception& e) {
        // host transport errors and the like count as a failed render
        state_ = CaptureState::Failed;
        throw ExportError::renderFailed(i, e.what());
    }

    ++cursor_;
    if (cursor_ >= total_) state_ = CaptureState::Drained;
    return state_ == CaptureState::Capturing;
}

void CaptureDriver::run(const CancelToken* cancel, const Progress& progress) {
    if (state_ == CaptureState::Idle) prime();

    while (state_ == CaptureState::Capturing) {
        if (cancel && cancel->load()) {
            state_ = CaptureState::Cancelled;
            throw ExportError(ErrorCode::Cancelled,
                              "cancelled before frame " + std::to_string(cursor_));
        }
        step();
        if (progress) progress(cursor_, total_);
    }
}

} // namespace spritebake
