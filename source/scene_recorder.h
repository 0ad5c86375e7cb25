// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Eigen/Core"
#include "Eigen/Geometry"

namespace mvis { namespace scene {

// Every timeline-tagged entry is keyed by its input frame index on this sequence timeline.
constexpr char kTimelineName[] = "input_frame_id";

using MeshVertices = Eigen::Matrix<float, Eigen::Dynamic, 3, Eigen::RowMajor>;
using MeshFaces = Eigen::Matrix<uint32_t, Eigen::Dynamic, 3, Eigen::RowMajor>;

struct LineSegment2D {
  Eigen::Vector2f a;
  Eigen::Vector2f b;
};

struct PinholeIntrinsics {
  double fx, fy, cx, cy;
  int width, height;

  Eigen::Matrix3d imageFromCamera() const
  {
    Eigen::Matrix3d k;
    k << fx, 0, cx,
         0, fy, cy,
         0, 0, 1;
    return k;
  }
};

enum class ViewCoordinates {
  kRightHandYDown,  // world: the upright first camera sees "up" along -Y
  kRDF,             // camera: X right, Y down, Z forward
};

// Destination for everything the visualizer emits. Each timeline-tagged call takes its frame
// explicitly, there is no "current time" state on the interface.
class SceneRecorder {
 public:
  virtual ~SceneRecorder() = default;

  virtual void logViewCoordinatesStatic(
      const std::string& entity_path, const ViewCoordinates coords) = 0;

  virtual void logImageFile(
      const std::string& entity_path, const int frame_id, const std::string& image_path) = 0;

  virtual void logPinhole(
      const std::string& entity_path, const int frame_id, const PinholeIntrinsics& intrinsics) = 0;

  // [R|t] maps parent (world) coordinates into the child (camera) frame.
  virtual void logRigidTransform(
      const std::string& entity_path,
      const int frame_id,
      const Eigen::Vector3d& child_from_parent_translation,
      const Eigen::Quaterniond& child_from_parent_rotation) = 0;

  virtual void logMesh(
      const std::string& entity_path,
      const int frame_id,
      const MeshVertices& vertices,
      const MeshFaces& faces,
      const MeshVertices& vertex_normals) = 0;

  virtual void logLineSegments2D(
      const std::string& entity_path,
      const int frame_id,
      const std::vector<LineSegment2D>& segments) = 0;

  // Explicitly retracts whatever was logged at entity_path, starting at frame_id.
  virtual void logClear(const std::string& entity_path, const int frame_id) = 0;

  // Writes the whole recording to path. Nothing is written before this is called.
  virtual void persist(const std::string& path) = 0;
};

namespace entity {

constexpr char kWorld[] = "world";
constexpr char kCamera[] = "world/camera";
constexpr char kCameraImage[] = "world/camera/image";

inline std::string pinholeOf(const std::string& camera_path) { return camera_path + "/image"; }

inline std::string skeleton2D(const int track_index)
{
  return std::string(kCameraImage) + "/skeleton/track_" + std::to_string(track_index);
}

inline std::string phaseRoot(const std::string& phase) { return std::string(kWorld) + "/phase_" + phase; }

inline std::string phaseMesh(const std::string& phase, const int track_index)
{
  return phaseRoot(phase) + "/track_" + std::to_string(track_index);
}

inline std::string phaseCamera(const std::string& phase) { return phaseRoot(phase) + "/camera"; }

}  // namespace entity

}}  // namespace mvis::scene
