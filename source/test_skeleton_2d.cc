// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "gtest/gtest.h"
#include "check.h"
#include "skeleton_2d.h"
#include "scene_timeline.h"
#include "test_scene_recorder.h"
#include "vis_errors.h"

namespace mvis { namespace scene { namespace {

constexpr int kBody25Joints = 25;

// Raw joint j sits at (j, 100 + j) with the given confidence.
FrameKeypoints makeFrame(const float confidence)
{
  FrameKeypoints kps(kBody25Joints, 3);
  for (int j = 0; j < kBody25Joints; ++j) kps.row(j) << float(j), 100.0f + j, confidence;
  return kps;
}

TEST(Skeleton2D, all_confident_joints_give_every_bone)
{
  const KeypointConvention& conv = openPoseBody25AsCoco17();
  EXPECT_EQ(conv.edges.size(), 19);
  EXPECT_EQ(conv.canonical_from_raw.size(), 17);
  EXPECT_EQ(extractSkeletonSegments(makeFrame(0.9f), conv).size(), 19);
}

TEST(Skeleton2D, bones_follow_the_raw_joint_permutation)
{
  FrameKeypoints kps = makeFrame(0.1f);
  // Canonical edge (1, 2) is left eye to right eye, raw joints 16 and 15.
  kps(16, 2) = 0.9f;
  kps(15, 2) = 0.9f;
  const std::vector<LineSegment2D> segments = extractSkeletonSegments(kps, openPoseBody25AsCoco17());
  ASSERT_EQ(segments.size(), 1);
  EXPECT_EQ(segments[0].a, Eigen::Vector2f(16, 116));
  EXPECT_EQ(segments[0].b, Eigen::Vector2f(15, 115));
}

TEST(Skeleton2D, confidence_threshold_is_strict)
{
  FrameKeypoints kps = makeFrame(0.1f);
  kps(16, 2) = 0.3f;
  kps(15, 2) = 0.3f;
  EXPECT_TRUE(extractSkeletonSegments(kps, openPoseBody25AsCoco17()).empty());

  kps(16, 2) = 0.30001f;
  kps(15, 2) = 0.30001f;
  EXPECT_EQ(extractSkeletonSegments(kps, openPoseBody25AsCoco17()).size(), 1);
}

TEST(Skeleton2D, bone_uses_the_weaker_endpoint)
{
  FrameKeypoints kps = makeFrame(0.1f);
  kps(16, 2) = 0.95f;
  kps(15, 2) = 0.25f;
  EXPECT_TRUE(extractSkeletonSegments(kps, openPoseBody25AsCoco17()).empty());
}

TEST(Skeleton2D, too_few_joints_is_an_error)
{
  const FrameKeypoints kps = makeFrame(0.9f).topRows(17);
  EXPECT_THROW(extractSkeletonSegments(kps, openPoseBody25AsCoco17()), DatasetError);
}

TEST(Skeleton2D, nothing_above_threshold_logs_exactly_one_clear)
{
  CapturingSceneRecorder rec;
  logSkeletonFrame(rec, 3, 7, makeFrame(0.2f), openPoseBody25AsCoco17());
  ASSERT_EQ(rec.events.size(), 1);
  EXPECT_EQ(rec.events[0].kind, RecordedEvent::kClear);
  EXPECT_EQ(rec.events[0].path, "world/camera/image/skeleton/track_3");
  EXPECT_EQ(rec.events[0].frame_id, 7);
}

TEST(Skeleton2D, confident_frame_logs_segments)
{
  CapturingSceneRecorder rec;
  logSkeletonFrame(rec, 0, 2, makeFrame(0.8f), openPoseBody25AsCoco17());
  ASSERT_EQ(rec.events.size(), 1);
  EXPECT_EQ(rec.events[0].kind, RecordedEvent::kLineSegments);
  EXPECT_EQ(rec.events[0].count, 19);
}

TEST(Skeleton2D, unseen_track_is_cleared_on_every_frame)
{
  MotionDataset dataset;
  dataset.seq_len = 4;
  dataset.track_ids = {"a", "b"};
  dataset.joints2d = {
      std::vector<FrameKeypoints>(4, makeFrame(0.9f)),
      std::vector<FrameKeypoints>(4, makeFrame(0.0f)),
  };

  CapturingSceneRecorder rec;
  logSkeletons2D(rec, dataset);
  const std::vector<RecordedEvent> unseen = rec.at(entity::skeleton2D(1));
  ASSERT_EQ(unseen.size(), 4);
  for (int f = 0; f < 4; ++f) {
    EXPECT_EQ(unseen[f].kind, RecordedEvent::kClear);
    EXPECT_EQ(unseen[f].frame_id, f);
  }
  EXPECT_EQ(rec.at(entity::skeleton2D(0)).size(), 4);
  EXPECT_EQ(rec.count(RecordedEvent::kLineSegments), 4);
}

}}}  // namespace mvis::scene::
