// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "scene_timeline.h"

#include "camera_trajectory.h"
#include "logger.h"
#include "phase_resolver.h"
#include "posed_mesh.h"
#include "skeleton_2d.h"

namespace mvis { namespace scene {

void logInputFrames(SceneRecorder& recorder, const MotionDataset& dataset)
{
  for (int frame_id = 0; frame_id < dataset.seq_len; ++frame_id) {
    recorder.logImageFile(entity::kCameraImage, frame_id, dataset.image_paths[frame_id]);
  }
}

void logSkeletons2D(SceneRecorder& recorder, const MotionDataset& dataset)
{
  const KeypointConvention& convention = openPoseBody25AsCoco17();
  for (int i = 0; i < dataset.numTracks(); ++i) {
    for (int frame_id = 0; frame_id < dataset.seq_len; ++frame_id) {
      logSkeletonFrame(recorder, i, frame_id, dataset.joints2d[i][frame_id], convention);
    }
  }
}

namespace {

void logPhase(
    SceneRecorder& recorder,
    const MotionDataset& dataset,
    const PhaseResult& result,
    const VisOptions& opts,
    BodyModelEvaluator& body_model)
{
  const PosedMeshes meshes = evaluatePosedMeshes(body_model, result);
  const CameraStream camera = result.cameraStream(kPhaseCameraTrack);

  std::string camera_path = entity::kCamera;
  if (opts.per_phase_camera) {
    camera_path = entity::phaseCamera(result.phase);
    recorder.logViewCoordinatesStatic(camera_path, ViewCoordinates::kRDF);
  }

  for (int frame_id = 0; frame_id < dataset.seq_len; ++frame_id) {
    logCameraPose(
        recorder, camera_path, frame_id, camera.rotations[frame_id], camera.translations[frame_id]);
    logPosedMeshesAtFrame(recorder, result.phase, meshes, dataset.vis_mask, frame_id);
  }
}

}  // namespace

TimelineSummary buildSceneTimeline(
    SceneRecorder& recorder,
    const MotionDataset& dataset,
    const std::string& log_dir,
    const VisOptions& opts,
    BodyModelEvaluator& body_model)
{
  TimelineSummary summary;
  recorder.logViewCoordinatesStatic(entity::kWorld, ViewCoordinates::kRightHandYDown);

  logInputFrames(recorder, dataset);
  logSkeletons2D(recorder, dataset);

  recorder.logViewCoordinatesStatic(entity::kCamera, ViewCoordinates::kRDF);
  logCameraTrajectory(recorder, entity::kCamera, dataset.camera, dataset.img_width, dataset.img_height);

  for (const std::string& phase : opts.phases) {
    const std::optional<PhaseResult> result = resolvePhase(phase, log_dir, dataset);
    if (!result) {
      summary.skipped_phases.push_back(phase);
      continue;
    }
    logPhase(recorder, dataset, *result, opts, body_model);
    summary.logged_phases.push_back(phase + "@" + result->iteration);
  }
  return summary;
}

}}  // namespace mvis::scene
