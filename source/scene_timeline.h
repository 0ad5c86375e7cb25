// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <string>
#include <vector>

#include "body_model.h"
#include "motion_dataset.h"
#include "scene_recorder.h"
#include "vis_config.h"

namespace mvis { namespace scene {

// Phase results store one camera stream per track; they are identical up to noise, so the
// first track's stream is the one drawn.
constexpr int kPhaseCameraTrack = 0;

struct TimelineSummary {
  std::vector<std::string> logged_phases;   // "<phase>@<iteration>"
  std::vector<std::string> skipped_phases;  // phase directory missing
};

void logInputFrames(SceneRecorder& recorder, const MotionDataset& dataset);
void logSkeletons2D(SceneRecorder& recorder, const MotionDataset& dataset);

// Everything that goes into one run's recording, in this order: the world convention, the
// input frames, the 2D skeletons, the defining camera, then each phase in opts.phases order.
// Does not persist the recording.
TimelineSummary buildSceneTimeline(
    SceneRecorder& recorder,
    const MotionDataset& dataset,
    const std::string& log_dir,
    const VisOptions& opts,
    BodyModelEvaluator& body_model);

}}  // namespace mvis::scene
