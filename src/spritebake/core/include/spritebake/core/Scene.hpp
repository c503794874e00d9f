#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "Frame.hpp"
#include "Geometry.hpp"

namespace spritebake {

/* Outcome of one render call. 'message' explains a failure. */
struct RenderStatus {
    bool ok{true};
    std::string message{};

    static RenderStatus failure(std::string msg) { return RenderStatus{false, std::move(msg)}; }
};

/*
  Animation side of the host scene.

  Implementations should provide:
    - currentTime(): the frame the scene is evaluated at right now.
    - setTime(): advance / rewind the scene to a frame.
    - getWorldBounds(): world AABB of all visible animated geometry at a frame,
      or nothing if the subject has no geometry.
*/
class IAnimationSystem {
public:
    virtual ~IAnimationSystem() = default;

    [[nodiscard]] virtual int currentTime() const = 0;

    virtual void setTime(int frame) = 0;

    [[nodiscard]] virtual std::optional<Aabb> getWorldBounds(int frame) = 0;
};

/*
  Rendering side of the host scene.

    - camera()/setCamera(): the active camera (pose + lens).
    - render(): rasterize the current scene state into an RGBA8 buffer of the
      given size. Must not throw for ordinary render errors; report them via
      RenderStatus instead.
*/
class IRenderer {
public:
    virtual ~IRenderer() = default;

    [[nodiscard]] virtual CameraState camera() const = 0;

    virtual void setCamera(const CameraPose& pose, const Projection& projection) = 0;

    [[nodiscard]] virtual RenderStatus render(std::uint32_t width, std::uint32_t height,
                                              FrameBuffer& out) = 0;
};

/* A host scene exposes both interfaces. */
class IScene : public IAnimationSystem, public IRenderer {};

/* Scene implementation types. */
enum class SceneType : std::uint8_t {
    Synthetic = 0,   // built-in procedural subject
    Remote    = 1    // gRPC render host
};

/* Factory for the requested scene. 'address' is used by Remote only
   (host:port). */
std::unique_ptr<IScene> makeScene(SceneType type, const std::string& address = {});

} // namespace spritebake
