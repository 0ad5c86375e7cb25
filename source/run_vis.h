// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "body_model.h"
#include "scene_recorder.h"
#include "vis_config.h"

namespace mvis {

enum class RunOutcome { kCompleted, kSkipped };

struct RunRequest {
  std::string log_dir;
  std::string save_dir;  // the recording is written to <save_dir>/log.rrd
  std::string device_id = "0";
  std::string sentinel_dir = kDefaultSentinelDir;
  VisOptions opts;
};

// How a run creates its recording sink and body model. Tests swap these for in-memory fakes.
struct RunBackends {
  std::function<std::unique_ptr<scene::SceneRecorder>(const std::string& recording_id)> make_recorder;
  std::function<std::unique_ptr<scene::BodyModelEvaluator>(
      const BodyModelConfig& cfg, const torch::Device& device)>
      make_body_model;
};

// rerun recording and TorchScript body model
RunBackends defaultRunBackends();

// Renders one optimization run into <save_dir>/log.rrd. Skips (without writing anything) when
// the run has no tracks, or when the recording already exists and opts.overwrite is off.
// Throws on anything that makes the run unrenderable, and DeviceUnavailableError before anything
// is loaded or recorded when req.device_id does not name a usable device.
RunOutcome visualizeRun(const RunRequest& req, const RunBackends& backends = defaultRunBackends());

}  // namespace mvis
