// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "run_vis.h"

#include "frame_export.h"
#include "logger.h"
#include "motion_dataset.h"
#include "rerun_scene_recorder.h"
#include "scene_timeline.h"
#include "util_file.h"
#include "util_string.h"
#include "util_torch.h"

namespace mvis {

namespace {

constexpr char kAppId[] = "motion_vis";

// Defers loading the weights until a phase actually needs meshes, then keeps them for the
// remaining phases of the run.
class LazyBodyModel : public scene::BodyModelEvaluator {
 public:
  LazyBodyModel(const RunBackends& backends, const BodyModelConfig& cfg, const torch::Device device)
      : backends(backends), cfg(cfg), device(device) {}

  scene::BodyModelOutput evaluate(const scene::BodyPoseBatch& batch) override
  {
    if (!model) model = backends.make_body_model(cfg, device);
    return model->evaluate(batch);
  }

 private:
  const RunBackends& backends;
  const BodyModelConfig cfg;
  const torch::Device device;
  std::unique_ptr<scene::BodyModelEvaluator> model;
};

struct ScopedRunLog {
  explicit ScopedRunLog(const std::string& path) { xpl::stdoutLogger.attachTextFileLog(path); }
  ~ScopedRunLog() { xpl::stdoutLogger.stopTextFileLog(); }
};

}  // namespace

RunBackends defaultRunBackends()
{
  RunBackends backends;
  backends.make_recorder = [](const std::string& recording_id) {
    return std::make_unique<scene::RerunSceneRecorder>(kAppId, recording_id);
  };
  backends.make_body_model = [](const BodyModelConfig& cfg, const torch::Device& device) {
    return std::make_unique<scene::TorchScriptBodyModel>(cfg, device);
  };
  return backends;
}

RunOutcome visualizeRun(const RunRequest& req, const RunBackends& backends)
{
  req.opts.validate();
  const torch::Device device = util_torch::selectTorchDevice(req.device_id);
  const RunConfig cfg = loadRunConfig(req.log_dir, req.sentinel_dir);
  const scene::MotionDataset dataset = scene::loadMotionDataset(cfg);
  if (dataset.numTracks() == 0) {
    XPLINFO << "No tracks in " << req.log_dir << ", skipping";
    return RunOutcome::kSkipped;
  }

  const std::string output_path = req.save_dir + "/" + kRecordingFilename;
  if (file::fileExists(output_path) && !req.opts.overwrite) {
    XPLINFO << output_path << " already exists, skipping (use --overwrite to replace it)";
    return RunOutcome::kSkipped;
  }

  file::createDirectoryIfNotExists(req.save_dir);
  ScopedRunLog run_log(req.save_dir + "/" + kRunLogFilename);
  XPLINFO << "Visualizing " << req.log_dir << " (" << dataset.numTracks() << " tracks, "
          << dataset.seq_len << " frames) on device " << req.device_id << " ("
          << util_torch::deviceTypeToString(device.type()) << ")";
  for (const std::string& ignored : req.opts.ignoredByRecorder()) {
    XPLWARN << "Option " << ignored << " only applies to the offline renderer, ignoring it";
  }

  BodyModelConfig body_cfg;
  body_cfg.model_path = cfg.body_model_path;
  body_cfg.batch_size = dataset.numTracks() * dataset.seq_len;
  body_cfg.device_id = req.device_id;
  LazyBodyModel body_model(backends, body_cfg, device);

  std::unique_ptr<scene::SceneRecorder> recorder = backends.make_recorder(req.save_dir);
  const scene::TimelineSummary summary =
      scene::buildSceneTimeline(*recorder, dataset, req.log_dir, req.opts, body_model);
  XPLINFO << "Logged phases [" << string::join(summary.logged_phases, ", ") << "], skipped ["
          << string::join(summary.skipped_phases, ", ") << "]";

  // log.rrd marks the run as done, so everything else has to be on disk first.
  if (req.opts.save_frames) scene::exportFrames(dataset, req.save_dir, req.opts.render_kps);
  recorder->persist(output_path);
  return RunOutcome::kCompleted;
}

}  // namespace mvis
