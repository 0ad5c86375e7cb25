// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <string>
#include <vector>

#include "Eigen/Core"
#include "camera_trajectory.h"
#include "skeleton_2d.h"
#include "vis_config.h"

namespace mvis { namespace scene {

using VisibilityMask = std::vector<std::vector<int>>;  // [track][frame], see VisibilityCode

// Body parameters the tracker estimated per frame before any optimization. The "input" phase
// is built from these.
struct TrackInitBody {
  std::vector<Eigen::Vector3d> trans;
  std::vector<Eigen::Vector3d> root_orient;  // axis-angle
  std::vector<Eigen::VectorXd> pose_body;    // axis-angle, 3 per body joint
  Eigen::VectorXd betas;                     // may be empty
};

// Everything the visualizer reads about one run's input video and tracks. Loaded once per run
// and not modified afterwards.
struct MotionDataset {
  std::string seq_name;
  int seq_len = 0;
  int img_width = 0;
  int img_height = 0;
  std::vector<std::string> track_ids;
  std::vector<std::string> image_paths;               // [frame]
  VisibilityMask vis_mask;                            // [track][frame]
  std::vector<std::vector<FrameKeypoints>> joints2d;  // [track][frame]
  CameraStream camera;                                // the defining camera, with intrinsics
  std::vector<TrackInitBody> init_body;               // [track], empty if not exported

  int numTracks() const { return track_ids.size(); }
  bool hasInitBody() const { return !init_body.empty(); }

  // Throws DatasetError unless every per-track and per-frame array matches seq_len and the
  // number of tracks.
  void validate() const;
};

// Identity poses, with fx = fy = max(width, height) and the principal point at the center.
CameraStream defaultCameraStream(const int seq_len, const int width, const int height);

MotionDataset loadMotionDataset(const RunConfig& cfg);

}}  // namespace mvis::scene
