#pragma once

#include "spritebake/core/Scene.hpp"

#include <memory>
#include <string>

namespace spritebake {

/*
  Host scene living in another process, reached over gRPC
  (service spritebake.RenderHost).

  Transport errors of the state calls (time, bounds, camera) throw
  std::runtime_error. Render transport errors and payload CRC mismatches
  are reported as a failed RenderStatus.
*/
class RemoteScene final : public IScene {
public:
    struct Options {
        int  deadlineMs   = 30000;   // per-call deadline (render may be slow)
        bool verifyCrc    = true;    // check RenderReply.crc32
    };

    explicit RemoteScene(const std::string& serverAddr);
    RemoteScene(const std::string& serverAddr, Options opt);
    ~RemoteScene() override;

    [[nodiscard]] int currentTime() const override;
    void setTime(int frame) override;
    [[nodiscard]] std::optional<Aabb> getWorldBounds(int frame) override;

    [[nodiscard]] CameraState camera() const override;
    void setCamera(const CameraPose& pose, const Projection& projection) override;
    [[nodiscard]] RenderStatus render(std::uint32_t width, std::uint32_t height,
                                      FrameBuffer& out) override;

    RemoteScene(const RemoteScene&)            = delete;
    RemoteScene& operator=(const RemoteScene&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace spritebake
