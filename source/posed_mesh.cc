// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "posed_mesh.h"

#include "logger.h"
#include "util_torch.h"
#include "visibility_gate.h"

namespace mvis { namespace scene {

MeshVertices computeVertexNormals(const MeshVertices& vertices, const MeshFaces& faces)
{
  MeshVertices normals = MeshVertices::Zero(vertices.rows(), 3);
  for (int f = 0; f < faces.rows(); ++f) {
    const Eigen::Vector3f a = vertices.row(faces(f, 0));
    const Eigen::Vector3f b = vertices.row(faces(f, 1));
    const Eigen::Vector3f c = vertices.row(faces(f, 2));
    const Eigen::Vector3f n = (b - a).cross(c - a);
    const float len = n.norm();
    if (len <= 0.0f) continue;
    for (int k = 0; k < 3; ++k) normals.row(faces(f, k)) += (n / len).transpose();
  }
  for (int v = 0; v < normals.rows(); ++v) {
    const float len = normals.row(v).norm();
    if (len > 0.0f) normals.row(v) /= len;
  }
  return normals;
}

MeshVertices PosedMeshes::trackFrameVertices(const int track_index, const int frame_id) const
{
  XCHECK(track_index >= 0 && track_index < numTracks()) << track_index;
  XCHECK(frame_id >= 0 && frame_id < numFrames()) << frame_id;
  const torch::Tensor v = vertices[track_index][frame_id];
  return Eigen::Map<const MeshVertices>(v.data_ptr<float>(), numVertices(), 3);
}

BodyPoseBatch makeBodyPoseBatch(const PhaseResult& result)
{
  const int64_t b = result.numTracks();
  const int64_t t = result.numFrames();
  BodyPoseBatch batch;
  batch.trans = result.trans.reshape({b * t, 3});
  batch.root_orient = result.root_orient.reshape({b * t, 3});
  batch.pose_body = result.pose_body.reshape({b * t, -1});
  if (result.hasBetas()) {
    // One shape per track, repeated over its frames
    batch.betas = result.betas.unsqueeze(1).expand({b, t, result.betas.size(1)}).reshape({b * t, -1});
  } else {
    batch.betas = torch::zeros({b * t, kDefaultNumBetas}, result.trans.options());
  }
  return batch;
}

PosedMeshes evaluatePosedMeshes(BodyModelEvaluator& evaluator, const PhaseResult& result)
{
  const int64_t b = result.numTracks();
  const int64_t t = result.numFrames();
  const BodyModelOutput out = evaluator.evaluate(makeBodyPoseBatch(result));
  util_torch::checkShape(out.vertices, {b * t, -1, 3}, "vertices");
  util_torch::checkShape(out.faces, {-1, 3}, "faces");

  PosedMeshes meshes;
  meshes.vertices = out.vertices.to(torch::kCPU, torch::kFloat32).reshape({b, t, -1, 3}).contiguous();

  const int64_t num_vertices = meshes.vertices.size(2);
  const torch::Tensor faces = out.faces.to(torch::kCPU, torch::kInt64).contiguous();
  auto faces_a = faces.accessor<int64_t, 2>();
  auto mesh_faces = std::make_shared<MeshFaces>(faces.size(0), 3);
  for (int f = 0; f < faces.size(0); ++f) {
    for (int k = 0; k < 3; ++k) {
      const int64_t idx = faces_a[f][k];
      XCHECK(idx >= 0 && idx < num_vertices) << "face " << f << " indexes vertex " << idx;
      (*mesh_faces)(f, k) = uint32_t(idx);
    }
  }
  meshes.faces = mesh_faces;
  XPLINFO << "phase " << result.phase << ": posed " << b << " tracks x " << t << " frames, "
          << num_vertices << " vertices, " << faces.size(0) << " faces";
  return meshes;
}

void logPosedMeshesAtFrame(
    SceneRecorder& recorder,
    const std::string& phase,
    const PosedMeshes& meshes,
    const VisibilityMask& vis_mask,
    const int frame_id)
{
  XCHECK_EQ(vis_mask.size(), meshes.numTracks());
  for (int i = 0; i < meshes.numTracks(); ++i) {
    const std::string path = entity::phaseMesh(phase, i);
    if (decideRender(vis_mask[i][frame_id]) == RenderDecision::kClear) {
      recorder.logClear(path, frame_id);
      continue;
    }
    const MeshVertices vertices = meshes.trackFrameVertices(i, frame_id);
    recorder.logMesh(path, frame_id, vertices, *meshes.faces, computeVertexNormals(vertices, *meshes.faces));
  }
}

}}  // namespace mvis::scene
