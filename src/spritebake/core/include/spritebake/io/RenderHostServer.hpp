#pragma once

#include "spritebake/core/Scene.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace spritebake {

/*
  Serves a local scene as spritebake.RenderHost.
  Calls are serialized: the scene is never entered by two RPCs at once.
  The server stops when the object is destroyed.
*/
class RenderHostServer {
public:
    struct Options {
        std::string bindHost = "0.0.0.0";
        bool        logCalls = false;   // one line per RPC
    };

    /// port 0 picks a free port, see port().
    RenderHostServer(IScene& scene, std::uint16_t port);
    RenderHostServer(IScene& scene, std::uint16_t port, Options opt);
    ~RenderHostServer();

    /// Port the server is actually bound to.
    [[nodiscard]] int port() const noexcept;

    /// Block until shutdown() is called from another thread.
    void wait();
    void shutdown();

    RenderHostServer(const RenderHostServer&)            = delete;
    RenderHostServer& operator=(const RenderHostServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> p_;
};

} // namespace spritebake
