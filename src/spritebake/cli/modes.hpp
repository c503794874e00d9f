#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error (see exit codes in main.cpp). */

/* Export an animation to a sprite sheet or frame files.
   Example:
     spritebake-cli bake --size=256x256 --frames=1:24 --angle=iso --out=out */
int run_bake (int argc, char** argv);

/* Serve the built-in synthetic scene as a gRPC render host.
   Example:
     spritebake-cli serve --port=50051 */
int run_serve(int argc, char** argv);

/* Print the grid a sheet of N frames would use.
   Example:
     spritebake-cli grid --count=10 --size=128x128 */
int run_grid (int argc, char** argv);
