// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <string>
#include <vector>

#include "Eigen/Core"
#include "Eigen/Geometry"
#include "scene_recorder.h"

namespace mvis { namespace scene {

// A per-frame camera pose stream. rotations/translations are cam_from_world, i.e. they map
// world points into the camera frame. intrinsics rows are (fx, fy, cx, cy); a stream that only
// carries poses leaves intrinsics empty.
struct CameraStream {
  std::vector<Eigen::Matrix3d> rotations;
  std::vector<Eigen::Vector3d> translations;
  std::vector<Eigen::Vector4d> intrinsics;

  int numFrames() const { return rotations.size(); }
  bool hasIntrinsics() const { return !intrinsics.empty(); }
};

// Logs the pose of frame_id under camera_path.
void logCameraPose(
    SceneRecorder& recorder,
    const std::string& camera_path,
    const int frame_id,
    const Eigen::Matrix3d& cam_from_world_rotation,
    const Eigen::Vector3d& cam_from_world_translation);

// Logs pinhole (under camera_path/image) and pose (under camera_path) for every frame of the
// stream, in frame order.
void logCameraTrajectory(
    SceneRecorder& recorder,
    const std::string& camera_path,
    const CameraStream& stream,
    const int image_width,
    const int image_height);

}}  // namespace mvis::scene
