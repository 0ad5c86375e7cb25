// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <string>
#include <vector>

namespace mvis {

constexpr char kDefaultSentinelDir[] = ".hydra";
constexpr char kRunConfigFilename[] = "config.json";
constexpr char kRecordingFilename[] = "log.rrd";
constexpr char kRunLogFilename[] = "vis_log.txt";

// Where a finished optimization run keeps its inputs, read from
// <log_dir>/<sentinel>/config.json. Relative paths are resolved against log_dir.
struct RunConfig {
  std::string log_dir;
  std::string seq_name;
  std::string image_dir;
  std::string tracks_json;
  std::string cameras_json;  // empty: identity camera with default intrinsics
  std::string body_model_path;
  int start_idx = 0;
  int end_idx = -1;  // exclusive, -1 for the end of the sequence
};

RunConfig loadRunConfig(const std::string& log_dir, const std::string& sentinel_dir);

// Exactly what the body model evaluator needs.
struct BodyModelConfig {
  std::string model_path;
  int batch_size = 0;  // number of (track, frame) pairs evaluated at once
  std::string device_id;

  void validate() const;
};

struct VisOptions {
  std::vector<std::string> phases = {"motion_chunks"};
  std::vector<std::string> render_views = {"src_cam", "front", "above", "side"};
  bool grid = false;
  bool render_layers = false;
  bool render_kps = false;
  bool save_frames = false;
  bool accumulate = false;
  bool overwrite = false;
  // Each phase's camera stream normally shares world/camera with the input camera, so the last
  // phase processed is the one visible. With this set every phase keeps its own camera.
  bool per_phase_camera = false;

  void validate() const;
  // Options that only the offline mesh renderer understands.
  std::vector<std::string> ignoredByRecorder() const;
};

}  // namespace mvis
