// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "camera_trajectory.h"

#include "logger.h"
#include "util_math.h"

namespace mvis { namespace scene {

void logCameraPose(
    SceneRecorder& recorder,
    const std::string& camera_path,
    const int frame_id,
    const Eigen::Matrix3d& cam_from_world_rotation,
    const Eigen::Vector3d& cam_from_world_translation)
{
  recorder.logRigidTransform(
      camera_path,
      frame_id,
      cam_from_world_translation,
      math::quaternionFromRotationMatrix(cam_from_world_rotation));
}

void logCameraTrajectory(
    SceneRecorder& recorder,
    const std::string& camera_path,
    const CameraStream& stream,
    const int image_width,
    const int image_height)
{
  XCHECK_EQ(stream.translations.size(), stream.rotations.size());
  XCHECK_EQ(stream.intrinsics.size(), stream.rotations.size())
      << "a trajectory with a pinhole needs intrinsics for every frame";

  for (int frame_id = 0; frame_id < stream.numFrames(); ++frame_id) {
    const Eigen::Vector4d& k = stream.intrinsics[frame_id];
    PinholeIntrinsics pinhole;
    pinhole.fx = k[0];
    pinhole.fy = k[1];
    pinhole.cx = k[2];
    pinhole.cy = k[3];
    pinhole.width = image_width;
    pinhole.height = image_height;
    recorder.logPinhole(entity::pinholeOf(camera_path), frame_id, pinhole);
    logCameraPose(
        recorder, camera_path, frame_id, stream.rotations[frame_id], stream.translations[frame_id]);
  }
}

}}  // namespace mvis::scene
