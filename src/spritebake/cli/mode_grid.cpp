#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "spritebake/compose/GridLayout.hpp"

#include <algorithm>
#include <iostream>
#include <optional>

int run_grid(int argc, char** argv) {
    const int count = argValueInt(argc, argv, "count", 0);

    int w = 0, h = 0;
    if (argGiven(argc, argv, "size") && !parsePair(argValue(argc, argv, "size"), 'x', w, h)) {
        std::cerr << "[grid] --size expects WxH\n";
        return kExitInvalid;
    }

    std::optional<spritebake::GridOverride> manual;
    if (argGiven(argc, argv, "grid")) {
        spritebake::GridOverride g{};
        if (!parsePair(argValue(argc, argv, "grid"), 'x', g.rows, g.cols)) {
            std::cerr << "[grid] --grid expects ROWSxCOLS\n";
            return kExitInvalid;
        }
        manual = g;
    }

    try {
        const auto layout = spritebake::solveGrid(count, manual,
                                                  static_cast<std::uint32_t>(std::max(0, w)),
                                                  static_cast<std::uint32_t>(std::max(0, h)));
        std::cout << "frames=" << count
                  << " rows=" << layout.rows << " cols=" << layout.cols
                  << " empty=" << (layout.capacity() - count);
        if (w > 0 && h > 0) {
            std::cout << " sheet=" << layout.sheetWidth() << "x" << layout.sheetHeight();
        }
        std::cout << "\n";
    } catch (const spritebake::ExportError& e) {
        std::cerr << "[grid] " << e.what() << "\n";
        return exitCodeFor(e);
    }
    return kExitOk;
}
