// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "rerun_scene_recorder.h"

#include <filesystem>

#include "logger.h"

namespace mvis { namespace scene {

std::array<float, 9> columnMajorImageFromCamera(const PinholeIntrinsics& intrinsics)
{
  std::array<float, 9> col_major;
  Eigen::Map<Eigen::Matrix3f>(col_major.data()) = intrinsics.imageFromCamera().cast<float>();
  return col_major;
}

RerunSceneRecorder::RerunSceneRecorder(const std::string& app_id, const std::string& recording_id)
    : rec(app_id, recording_id)
{}

void RerunSceneRecorder::setFrame(const int frame_id) { rec.set_time_sequence(kTimelineName, frame_id); }

void RerunSceneRecorder::logViewCoordinatesStatic(
    const std::string& entity_path, const ViewCoordinates coords)
{
  switch (coords) {
  case ViewCoordinates::kRightHandYDown:
    rec.log_static(entity_path, rerun::ViewCoordinates::RIGHT_HAND_Y_DOWN);
    break;
  case ViewCoordinates::kRDF:
    rec.log_static(entity_path, rerun::ViewCoordinates::RDF);
    break;
  }
}

void RerunSceneRecorder::logImageFile(
    const std::string& entity_path, const int frame_id, const std::string& image_path)
{
  setFrame(frame_id);
  // The encoded bytes are stored as-is, the viewer decodes them.
  rec.log(entity_path, rerun::EncodedImage::from_file(image_path).value_or_throw());
}

void RerunSceneRecorder::logPinhole(
    const std::string& entity_path, const int frame_id, const PinholeIntrinsics& intrinsics)
{
  setFrame(frame_id);
  rec.log(
      entity_path,
      rerun::Pinhole(rerun::datatypes::Mat3x3(columnMajorImageFromCamera(intrinsics)))
          .with_resolution(float(intrinsics.width), float(intrinsics.height)));
}

void RerunSceneRecorder::logRigidTransform(
    const std::string& entity_path,
    const int frame_id,
    const Eigen::Vector3d& child_from_parent_translation,
    const Eigen::Quaterniond& child_from_parent_rotation)
{
  const Eigen::Vector3f t = child_from_parent_translation.cast<float>();
  const Eigen::Quaternionf q = child_from_parent_rotation.cast<float>();
  setFrame(frame_id);
  rec.log(
      entity_path,
      rerun::Transform3D::from_translation_rotation(
          rerun::Vec3D(t.x(), t.y(), t.z()), rerun::Quaternion::from_xyzw(q.x(), q.y(), q.z(), q.w()))
          .with_relation(rerun::components::TransformRelation::ChildFromParent));
}

void RerunSceneRecorder::logMesh(
    const std::string& entity_path,
    const int frame_id,
    const MeshVertices& vertices,
    const MeshFaces& faces,
    const MeshVertices& vertex_normals)
{
  XCHECK_EQ(vertex_normals.rows(), vertices.rows());
  std::vector<rerun::Position3D> positions;
  std::vector<rerun::Vector3D> normals;
  std::vector<rerun::TriangleIndices> triangles;
  positions.reserve(vertices.rows());
  normals.reserve(vertices.rows());
  triangles.reserve(faces.rows());
  for (int v = 0; v < vertices.rows(); ++v) {
    positions.emplace_back(vertices(v, 0), vertices(v, 1), vertices(v, 2));
    normals.emplace_back(vertex_normals(v, 0), vertex_normals(v, 1), vertex_normals(v, 2));
  }
  for (int f = 0; f < faces.rows(); ++f) triangles.emplace_back(faces(f, 0), faces(f, 1), faces(f, 2));

  setFrame(frame_id);
  rec.log(
      entity_path,
      rerun::Mesh3D(std::move(positions))
          .with_triangle_indices(std::move(triangles))
          .with_vertex_normals(std::move(normals)));
}

void RerunSceneRecorder::logLineSegments2D(
    const std::string& entity_path, const int frame_id, const std::vector<LineSegment2D>& segments)
{
  std::vector<rerun::components::LineStrip2D> strips;
  strips.reserve(segments.size());
  for (const LineSegment2D& s : segments) {
    strips.emplace_back(std::vector<rerun::datatypes::Vec2D>{{s.a.x(), s.a.y()}, {s.b.x(), s.b.y()}});
  }
  setFrame(frame_id);
  rec.log(entity_path, rerun::LineStrips2D(std::move(strips)));
}

void RerunSceneRecorder::logClear(const std::string& entity_path, const int frame_id)
{
  setFrame(frame_id);
  rec.log(entity_path, rerun::Clear::FLAT);
}

void RerunSceneRecorder::persist(const std::string& path)
{
  const std::string tmp_path = path + ".tmp";
  XPLINFO << "Writing recording: " << path;
  rec.save(tmp_path).throw_on_failure();
  rec.flush_blocking();
  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  XCHECK(!ec) << "failed to move " << tmp_path << " to " << path << ": " << ec.message();
}

}}  // namespace mvis::scene
