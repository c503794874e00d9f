#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "spritebake/io/RenderHostServer.hpp"
#include "synthetic/SyntheticScene.hpp"

#include <chrono>
#include <iostream>
#include <thread>

int run_serve(int argc, char** argv) {
    const int port = argValueInt(argc, argv, "port", 50051);
    if (port < 0 || port > 65535) {
        std::cerr << "[serve] bad --port\n";
        return kExitInvalid;
    }

    spritebake::SyntheticScene::Options so{};
    so.cycleFrames = argValueInt(argc, argv, "cycle", so.cycleFrames);
    so.walkSpeed   = argValueDouble(argc, argv, "walk", so.walkSpeed);
    so.swingDeg    = argValueDouble(argc, argv, "swing", so.swingDeg);
    so.empty       = argHas(argc, argv, "empty-scene");

    spritebake::RenderHostServer::Options ho{};
    ho.bindHost = argValue(argc, argv, "bind", ho.bindHost);
    ho.logCalls = argHas(argc, argv, "log-calls");

    std::cout << "[serve] synthetic scene, cycle=" << so.cycleFrames
              << ", walk=" << so.walkSpeed << ", port=" << port << "\n";

    try {
        spritebake::SyntheticScene scene(so);
        spritebake::RenderHostServer server(scene, static_cast<std::uint16_t>(port), ho);

        installInterruptHandler();
        std::thread watcher([&server]{
            using namespace std::chrono_literals;
            while (!interruptFlag().load()) std::this_thread::sleep_for(100ms);
            server.shutdown();
        });

        server.wait();
        interruptFlag().store(true);
        watcher.join();
    } catch (const std::exception& e) {
        std::cerr << "[serve] error: " << e.what() << '\n';
        return kExitFailed;
    }
    return kExitOk;
}
