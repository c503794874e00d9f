#include "spritebake/core/Scene.hpp"
#include "spritebake/io/RenderHostClient.hpp"
#include "synthetic/SyntheticScene.hpp"

#include <memory>
#include <stdexcept>

namespace spritebake {

std::unique_ptr<IScene> makeScene(SceneType type, const std::string& address /*={}*/)
{
    switch (type) {
        case SceneType::Synthetic:
            return std::make_unique<SyntheticScene>();

        case SceneType::Remote:
            if (address.empty()) {
                throw std::runtime_error("Remote scene requires a host address (host:port)");
            }
            return std::make_unique<RemoteScene>(address);
    }
    throw std::runtime_error("Requested scene type not implemented");
}

} // namespace spritebake
