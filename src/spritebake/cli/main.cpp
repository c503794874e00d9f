#include "modes.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - bake  : export an animation (synthetic or remote scene) to a sprite
              sheet or numbered frames.
    - serve : run the synthetic scene as a gRPC render host.
    - grid  : print the sheet layout for a frame count.

  Exit codes: 0 ok, 1 export failed, 2 invalid options/job, 3 cancelled.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  spritebake-cli bake  [--config=job.yaml] [--scene=synthetic|remote] [--host=localhost:50051]\n"
        << "                       [--name=animation] [--out=.] [--size=512x512] [--frames=1:24]\n"
        << "                       [--angle=front|iso|side] [--dir=x,y,z] [--projection=ortho|persp]\n"
        << "                       [--padding=0.2] [--mirror] [--format=png|webp] [--mode=sheet|frames]\n"
        << "                       [--grid=ROWSxCOLS] [--step=1] [--stride=1] [--manifest]\n"
        << "                       [--tmp=DIR] [--budget-mb=4096] [--png-level=3] [--webp-quality=101]\n"
        << "                       [--fov=40] [--quiet]\n"
        << "                       synthetic scene: [--cycle=24] [--walk=0] [--swing=35] [--empty-scene]\n"
        << "  spritebake-cli serve [--port=50051] [--bind=0.0.0.0] [--log-calls]\n"
        << "                       [--cycle=24] [--walk=0] [--swing=35] [--empty-scene]\n"
        << "  spritebake-cli grid  --count=N [--grid=ROWSxCOLS] [--size=WxH]\n"
        << "     Command line options override values from --config.\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return kExitOk; }
    const std::string mode = argv[1];

    if      (mode == "bake")  return run_bake (argc, argv);
    else if (mode == "serve") return run_serve(argc, argv);
    else if (mode == "grid")  return run_grid (argc, argv);
    else if (mode == "help" || mode == "--help") { print_usage(); return kExitOk; }

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return kExitInvalid;
}
