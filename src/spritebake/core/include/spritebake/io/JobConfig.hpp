#pragma once

#include "spritebake/core/Config.hpp"

#include <filesystem>
#include <string>

namespace spritebake {

/* Export job plus pipeline knobs, as read from a job file. */
struct JobFile {
    ExportJob job{};
    PipelineConfig pipeline{};
};

/*
  YAML job file. Every key is optional, missing keys keep the defaults:

    name: walk_cycle
    output_dir: out
    frame_size: [256, 256]
    frames: [1, 24]            # inclusive range
    angle: isometric           # front | isometric | side | custom
    direction: [1, -1, 0.5]    # with angle: custom
    projection: orthographic   # orthographic | perspective
    padding: 0.2
    mirror: false
    format: png                # png | webp
    mode: sheet                # sheet | frames
    grid: {rows: 4, cols: 6}   # omit for automatic layout
    sampling_stride: 1
    manifest: true
    pipeline:
      temp_dir: /tmp
      temp_budget_mb: 4096
      png_compression: 3
      webp_quality: 101
      fov_deg: 40
      log: true

  Malformed YAML, wrong value types and unknown enum names throw
  std::runtime_error naming the offending key. Range checks are left to
  validateJob().
*/
JobFile parseJobYaml(const std::string& text, JobFile defaults = {});
JobFile loadJobYaml(const std::filesystem::path& path, JobFile defaults = {});

} // namespace spritebake
