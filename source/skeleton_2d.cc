// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "skeleton_2d.h"

#include <algorithm>

#include "logger.h"
#include "vis_errors.h"

namespace mvis { namespace scene {

namespace {

KeypointConvention makeOpenPoseBody25AsCoco17()
{
  KeypointConvention c;
  c.name = "openpose_body25_as_coco17";
  // COCO order: nose, l/r eye, l/r ear, l/r shoulder, l/r elbow, l/r wrist, l/r hip, l/r knee,
  // l/r ankle
  c.canonical_from_raw = {0, 16, 15, 18, 17, 5, 2, 6, 3, 7, 4, 12, 9, 13, 10, 14, 11};
  c.edges = {
      {15, 13}, {13, 11}, {16, 14}, {14, 12}, {11, 12}, {5, 11}, {6, 12},
      {5, 6},   {5, 7},   {6, 8},   {7, 9},   {8, 10},  {1, 2},  {0, 1},
      {0, 2},   {1, 3},   {2, 4},   {3, 5},   {4, 6},
  };
  c.min_confidence = 0.3f;
  return c;
}

}  // namespace

int KeypointConvention::minRawJoints() const
{
  int max_raw = -1;
  for (const int r : canonical_from_raw) max_raw = std::max(max_raw, r);
  return max_raw + 1;
}

const KeypointConvention& openPoseBody25AsCoco17()
{
  static const KeypointConvention kConvention = makeOpenPoseBody25AsCoco17();
  return kConvention;
}

std::vector<LineSegment2D> extractSkeletonSegments(
    const FrameKeypoints& raw_joints, const KeypointConvention& convention)
{
  if (raw_joints.rows() < convention.minRawJoints()) {
    throw DatasetError(
        "keypoint frame has " + std::to_string(raw_joints.rows()) + " joints, convention " +
        convention.name + " needs " + std::to_string(convention.minRawJoints()));
  }

  const int num_canonical = convention.canonical_from_raw.size();
  std::vector<LineSegment2D> segments;
  for (const auto& [ca, cb] : convention.edges) {
    XCHECK(ca >= 0 && ca < num_canonical && cb >= 0 && cb < num_canonical)
        << "edge (" << ca << ", " << cb << ") outside " << convention.name;
    const auto ja = raw_joints.row(convention.canonical_from_raw[ca]);
    const auto jb = raw_joints.row(convention.canonical_from_raw[cb]);
    const float confidence = std::min(ja(2), jb(2));
    if (!(confidence > convention.min_confidence)) continue;
    segments.push_back({Eigen::Vector2f(ja(0), ja(1)), Eigen::Vector2f(jb(0), jb(1))});
  }
  return segments;
}

void logSkeletonFrame(
    SceneRecorder& recorder,
    const int track_index,
    const int frame_id,
    const FrameKeypoints& raw_joints,
    const KeypointConvention& convention)
{
  const std::string path = entity::skeleton2D(track_index);
  const std::vector<LineSegment2D> segments = extractSkeletonSegments(raw_joints, convention);
  if (segments.empty()) {
    recorder.logClear(path, frame_id);
  } else {
    recorder.logLineSegments2D(path, frame_id, segments);
  }
}

}}  // namespace mvis::scene
