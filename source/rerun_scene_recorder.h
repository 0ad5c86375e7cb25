// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <array>
#include <string>

#include <rerun.hpp>

#include "scene_recorder.h"

namespace mvis { namespace scene {

// K in the column-major order rerun::datatypes::Mat3x3 is built from.
std::array<float, 9> columnMajorImageFromCamera(const PinholeIntrinsics& intrinsics);

// Records into an in-memory rerun stream. Nothing touches the disk until persist().
class RerunSceneRecorder : public SceneRecorder {
 public:
  // recording_id should be stable for a run so that re-rendering it replaces the recording in
  // the viewer instead of adding a second one.
  RerunSceneRecorder(const std::string& app_id, const std::string& recording_id);

  void logViewCoordinatesStatic(const std::string& entity_path, const ViewCoordinates coords) override;
  void logImageFile(const std::string& entity_path, const int frame_id, const std::string& image_path) override;
  void logPinhole(const std::string& entity_path, const int frame_id, const PinholeIntrinsics& intrinsics) override;
  void logRigidTransform(
      const std::string& entity_path,
      const int frame_id,
      const Eigen::Vector3d& child_from_parent_translation,
      const Eigen::Quaterniond& child_from_parent_rotation) override;
  void logMesh(
      const std::string& entity_path,
      const int frame_id,
      const MeshVertices& vertices,
      const MeshFaces& faces,
      const MeshVertices& vertex_normals) override;
  void logLineSegments2D(
      const std::string& entity_path,
      const int frame_id,
      const std::vector<LineSegment2D>& segments) override;
  void logClear(const std::string& entity_path, const int frame_id) override;

  // Saves to <path>.tmp and renames it into place once everything is flushed, so a crash never
  // leaves a truncated recording at path.
  void persist(const std::string& path) override;

 private:
  rerun::RecordingStream rec;

  void setFrame(const int frame_id);
};

}}  // namespace mvis::scene
