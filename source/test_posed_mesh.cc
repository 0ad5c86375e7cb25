// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "gtest/gtest.h"
#include "posed_mesh.h"
#include "test_scene_recorder.h"
#include "visibility_gate.h"

namespace mvis { namespace scene { namespace {

PhaseResult makePhaseResult(const int num_tracks, const int num_frames)
{
  PhaseResult r;
  r.phase = "motion_chunks";
  r.iteration = "000100";
  r.trans = torch::zeros({num_tracks, num_frames, 3});
  for (int i = 0; i < num_tracks; ++i) {
    for (int f = 0; f < num_frames; ++f) {
      r.trans[i][f][0] = float(i);
      r.trans[i][f][1] = float(f);
    }
  }
  r.root_orient = torch::zeros({num_tracks, num_frames, 3});
  r.pose_body = torch::zeros({num_tracks, num_frames, 63});
  r.cam_R = torch::eye(3).expand({num_tracks, num_frames, 3, 3}).contiguous();
  r.cam_t = torch::zeros({num_tracks, num_frames, 3});
  return r;
}

TEST(VisibilityGate, only_out_of_frame_is_cleared)
{
  EXPECT_EQ(decideRender(kOutOfFrame), RenderDecision::kClear);
  EXPECT_EQ(decideRender(kOccluded), RenderDecision::kRender);
  EXPECT_EQ(decideRender(kVisible), RenderDecision::kRender);
  EXPECT_EQ(decideRender(-5), RenderDecision::kClear);
}

TEST(PosedMesh, normals_of_a_flat_triangle)
{
  MeshVertices v(3, 3);
  v << 0, 0, 0,
       1, 0, 0,
       0, 1, 0;
  MeshFaces f(1, 3);
  f << 0, 1, 2;
  const MeshVertices n = computeVertexNormals(v, f);
  for (int i = 0; i < 3; ++i) {
    EXPECT_NEAR(n(i, 0), 0.0f, 1e-6);
    EXPECT_NEAR(n(i, 1), 0.0f, 1e-6);
    EXPECT_NEAR(n(i, 2), 1.0f, 1e-6);
  }
}

TEST(PosedMesh, normals_ignore_face_area)
{
  // A small and a huge face meeting at vertex 0 at a right angle
  MeshVertices v(5, 3);
  v << 0, 0, 0,
       0.01, 0, 0,
       0, 0.01, 0,
       0, 100, 0,
       0, 0, 100;
  MeshFaces f(2, 3);
  f << 0, 1, 2,
       0, 3, 4;
  const MeshVertices n = computeVertexNormals(v, f);
  const float s = std::sqrt(0.5f);
  EXPECT_NEAR(n(0, 0), s, 1e-5);
  EXPECT_NEAR(n(0, 1), 0.0f, 1e-5);
  EXPECT_NEAR(n(0, 2), s, 1e-5);
}

TEST(PosedMesh, degenerate_faces_leave_zero_normals)
{
  MeshVertices v(4, 3);
  v << 0, 0, 0,
       1, 0, 0,
       2, 0, 0,
       5, 5, 5;
  MeshFaces f(1, 3);
  f << 0, 1, 2;
  const MeshVertices n = computeVertexNormals(v, f);
  EXPECT_EQ(n.norm(), 0.0f);
}

TEST(PosedMesh, betas_are_repeated_for_every_frame_of_their_track)
{
  PhaseResult r = makePhaseResult(2, 3);
  r.betas = torch::zeros({2, 10});
  r.betas[1].fill_(1.0f);
  const BodyPoseBatch batch = makeBodyPoseBatch(r);
  ASSERT_EQ(batch.size(), 6);
  ASSERT_EQ(batch.betas.size(1), 10);
  EXPECT_EQ(batch.betas.slice(0, 0, 3).sum().item<float>(), 0.0f);
  EXPECT_EQ(batch.betas.slice(0, 3, 6).sum().item<float>(), 30.0f);
  // Row order is track major
  EXPECT_EQ(batch.trans[4][0].item<float>(), 1.0f);
  EXPECT_EQ(batch.trans[4][1].item<float>(), 1.0f);
}

TEST(PosedMesh, missing_betas_become_zero_shape)
{
  const BodyPoseBatch batch = makeBodyPoseBatch(makePhaseResult(1, 2));
  ASSERT_EQ(batch.betas.size(0), 2);
  EXPECT_EQ(batch.betas.size(1), kDefaultNumBetas);
  EXPECT_EQ(batch.betas.abs().sum().item<float>(), 0.0f);
}

TEST(PosedMesh, whole_phase_is_one_evaluation)
{
  FakeBodyModel model;
  const PosedMeshes meshes = evaluatePosedMeshes(model, makePhaseResult(2, 3));
  EXPECT_EQ(model.num_evaluations, 1);
  EXPECT_EQ(model.last_batch_size, 6);
  EXPECT_EQ(meshes.numTracks(), 2);
  EXPECT_EQ(meshes.numFrames(), 3);
  EXPECT_EQ(meshes.numVertices(), 3);
  ASSERT_EQ(meshes.faces->rows(), 1);

  const MeshVertices v = meshes.trackFrameVertices(1, 2);
  EXPECT_EQ(v(0, 0), 1.0f);
  EXPECT_EQ(v(0, 1), 2.0f);
  EXPECT_EQ(v(1, 0), 2.0f);
}

TEST(PosedMesh, visibility_mask_drives_meshes_and_clears)
{
  const VisibilityMask vis_mask = {{1, -1, 0}, {-1, 1, 1}};
  FakeBodyModel model;
  const PosedMeshes meshes = evaluatePosedMeshes(model, makePhaseResult(2, 3));

  CapturingSceneRecorder rec;
  for (int f = 0; f < 3; ++f) logPosedMeshesAtFrame(rec, "motion_chunks", meshes, vis_mask, f);

  const std::vector<RecordedEvent> track0 = rec.at(entity::phaseMesh("motion_chunks", 0));
  const std::vector<RecordedEvent> track1 = rec.at(entity::phaseMesh("motion_chunks", 1));
  ASSERT_EQ(track0.size(), 3);
  ASSERT_EQ(track1.size(), 3);
  EXPECT_EQ(track0[0].kind, RecordedEvent::kMesh);
  EXPECT_EQ(track0[1].kind, RecordedEvent::kClear);
  EXPECT_EQ(track0[2].kind, RecordedEvent::kMesh);
  EXPECT_EQ(track1[0].kind, RecordedEvent::kClear);
  EXPECT_EQ(track1[1].kind, RecordedEvent::kMesh);
  EXPECT_EQ(track1[2].kind, RecordedEvent::kMesh);
  for (int f = 0; f < 3; ++f) {
    EXPECT_EQ(track0[f].frame_id, f);
    EXPECT_EQ(track1[f].frame_id, f);
  }
  EXPECT_EQ(rec.count(RecordedEvent::kMesh), 4);
  EXPECT_EQ(rec.count(RecordedEvent::kClear), 2);
  EXPECT_EQ(rec.events[0].path, "world/phase_motion_chunks/track_0");
}

}}}  // namespace mvis::scene::
