// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "gtest/gtest.h"
#include "scene_timeline.h"
#include "test_run_fixture.h"
#include "test_scene_recorder.h"
#include "vis_errors.h"

namespace mvis { namespace scene { namespace {

constexpr int kTracks = 2;
constexpr int kFrames = 3;

class SceneTimelineTest : public ::testing::Test {
 protected:
  test::ScopedTempDir tmp;
  std::string log_dir;
  MotionDataset dataset;
  VisOptions opts;

  void SetUp() override
  {
    log_dir = tmp.path() + "/run";
    test::FakeRunLayout layout;
    layout.num_tracks = kTracks;
    layout.num_frames = kFrames;
    layout.vis_mask = {{1, -1, 0}, {-1, 1, 1}};
    test::writeFakeRun(log_dir, layout);
    file::createDirectoryIfNotExists(log_dir + "/motion_chunks");
    test::writeSnapshot(
        log_dir + "/motion_chunks/fake_seq_000030_world_results.pt", kTracks, kFrames, 1.0f, 9.0f);
    dataset = loadMotionDataset(loadRunConfig(log_dir, kDefaultSentinelDir));
  }
};

TEST_F(SceneTimelineTest, recording_order)
{
  CapturingSceneRecorder rec;
  FakeBodyModel model;
  buildSceneTimeline(rec, dataset, log_dir, opts, model);

  ASSERT_FALSE(rec.events.empty());
  EXPECT_EQ(rec.events[0].kind, RecordedEvent::kViewCoordinates);
  EXPECT_EQ(rec.events[0].path, "world");
  EXPECT_EQ(rec.events[0].detail, "RIGHT_HAND_Y_DOWN");

  const int first_image = rec.indexOf(RecordedEvent::kImage, entity::kCameraImage);
  const int first_skeleton = rec.indexOf(RecordedEvent::kLineSegments, entity::skeleton2D(0));
  const int camera_coords = rec.indexOf(RecordedEvent::kViewCoordinates, entity::kCamera);
  const int first_pinhole = rec.indexOf(RecordedEvent::kPinhole, entity::kCameraImage);
  const int first_mesh = rec.indexOf(RecordedEvent::kMesh, entity::phaseMesh("motion_chunks", 0));
  ASSERT_GE(first_image, 0);
  EXPECT_LT(first_image, first_skeleton);
  EXPECT_LT(first_skeleton, camera_coords);
  EXPECT_LT(camera_coords, first_pinhole);
  EXPECT_LT(first_pinhole, first_mesh);
  EXPECT_EQ(rec.events[camera_coords].detail, "RDF");

  EXPECT_EQ(rec.count(RecordedEvent::kImage), kFrames);
  EXPECT_EQ(rec.count(RecordedEvent::kPinhole), kFrames);
  EXPECT_EQ(rec.count(RecordedEvent::kMesh), 4);
  EXPECT_EQ(rec.count(RecordedEvent::kClear), 2);
}

TEST_F(SceneTimelineTest, same_inputs_same_recording)
{
  CapturingSceneRecorder rec1, rec2;
  FakeBodyModel model1, model2;
  buildSceneTimeline(rec1, dataset, log_dir, opts, model1);
  buildSceneTimeline(rec2, dataset, log_dir, opts, model2);
  ASSERT_EQ(rec1.events.size(), rec2.events.size());
  EXPECT_TRUE(rec1.events == rec2.events);
}

TEST_F(SceneTimelineTest, missing_phase_is_skipped)
{
  opts.phases = {"smooth_fit", "motion_chunks"};
  CapturingSceneRecorder rec;
  FakeBodyModel model;
  const TimelineSummary summary = buildSceneTimeline(rec, dataset, log_dir, opts, model);
  EXPECT_EQ(summary.skipped_phases, std::vector<std::string>({"smooth_fit"}));
  EXPECT_EQ(summary.logged_phases, std::vector<std::string>({"motion_chunks@000030"}));
  EXPECT_EQ(model.num_evaluations, 1);
  EXPECT_TRUE(rec.at(entity::phaseMesh("smooth_fit", 0)).empty());
}

TEST_F(SceneTimelineTest, one_evaluation_per_phase)
{
  opts.phases = {"input", "motion_chunks"};
  CapturingSceneRecorder rec;
  FakeBodyModel model;
  const TimelineSummary summary = buildSceneTimeline(rec, dataset, log_dir, opts, model);
  EXPECT_EQ(summary.logged_phases, std::vector<std::string>({"input@000000", "motion_chunks@000030"}));
  EXPECT_EQ(model.num_evaluations, 2);
  EXPECT_EQ(model.last_batch_size, kTracks * kFrames);
  EXPECT_EQ(rec.at(entity::phaseMesh("input", 1)).size(), kFrames);
}

TEST_F(SceneTimelineTest, phase_camera_shares_the_camera_path)
{
  CapturingSceneRecorder rec;
  FakeBodyModel model;
  buildSceneTimeline(rec, dataset, log_dir, opts, model);

  std::vector<RecordedEvent> poses;
  for (const RecordedEvent& e : rec.at(entity::kCamera)) {
    if (e.kind == RecordedEvent::kTransform) poses.push_back(e);
  }
  // The defining camera, then the phase camera overriding it frame by frame.
  ASSERT_EQ(poses.size(), 2 * kFrames);
  const std::vector<Eigen::Vector3d>& t = rec.translations;
  ASSERT_EQ(t.size(), 2 * kFrames);
  for (int f = 0; f < kFrames; ++f) {
    EXPECT_EQ(poses[kFrames + f].frame_id, f);
    // Track 0's stream sits at x = 0; track 1's would be at x = 1.
    EXPECT_EQ(t[kFrames + f], Eigen::Vector3d(0, 0, 9));
  }
}

TEST_F(SceneTimelineTest, per_phase_camera_keeps_its_own_path)
{
  opts.per_phase_camera = true;
  CapturingSceneRecorder rec;
  FakeBodyModel model;
  buildSceneTimeline(rec, dataset, log_dir, opts, model);

  int shared = 0, own = 0;
  for (const RecordedEvent& e : rec.events) {
    if (e.kind != RecordedEvent::kTransform) continue;
    if (e.path == entity::kCamera) ++shared;
    if (e.path == entity::phaseCamera("motion_chunks")) ++own;
  }
  EXPECT_EQ(shared, kFrames);
  EXPECT_EQ(own, kFrames);
  EXPECT_GE(rec.indexOf(RecordedEvent::kViewCoordinates, entity::phaseCamera("motion_chunks")), 0);
}

TEST_F(SceneTimelineTest, corrupt_phase_propagates)
{
  std::ofstream(log_dir + "/motion_chunks/fake_seq_000040_world_results.pt") << "bad";
  CapturingSceneRecorder rec;
  FakeBodyModel model;
  EXPECT_THROW(buildSceneTimeline(rec, dataset, log_dir, opts, model), SnapshotError);
}

}}}  // namespace mvis::scene::
