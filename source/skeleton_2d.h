// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "Eigen/Core"
#include "scene_recorder.h"

namespace mvis { namespace scene {

// One frame of detections for one track: a row per raw joint holding (x, y, confidence).
using FrameKeypoints = Eigen::Matrix<float, Eigen::Dynamic, 3, Eigen::RowMajor>;

// How raw detector joints become drawable bones. canonical_from_raw[c] is the raw joint that
// lands at canonical index c, and edges index into the canonical order.
struct KeypointConvention {
  std::string name;
  std::vector<int> canonical_from_raw;
  std::vector<std::pair<int, int>> edges;
  float min_confidence;  // a bone is kept only if strictly above this

  int minRawJoints() const;
};

// OpenPose BODY_25 detections drawn with the COCO-17 limb layout.
const KeypointConvention& openPoseBody25AsCoco17();

// Bones of one frame that pass the confidence filter, in edge order. A bone's confidence is
// the lower of its two endpoint confidences.
std::vector<LineSegment2D> extractSkeletonSegments(
    const FrameKeypoints& raw_joints, const KeypointConvention& convention);

// Logs one track's overlay for one frame: the surviving bones, or a clear when none survive so
// a stale overlay never lingers.
void logSkeletonFrame(
    SceneRecorder& recorder,
    const int track_index,
    const int frame_id,
    const FrameKeypoints& raw_joints,
    const KeypointConvention& convention);

}}  // namespace mvis::scene
