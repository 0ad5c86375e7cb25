// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <map>
#include <optional>
#include <string>

#include "torch/torch.h"
#include "camera_trajectory.h"
#include "motion_dataset.h"

namespace mvis { namespace scene {

constexpr char kInputPhase[] = "input";
constexpr char kInputIteration[] = "000000";
constexpr char kWorldBlock[] = "world";

// The world-space result of one optimization phase, on the CPU. B tracks, T frames.
struct PhaseResult {
  std::string phase;
  std::string iteration;
  torch::Tensor trans;        // [B, T, 3]
  torch::Tensor root_orient;  // [B, T, 3]
  torch::Tensor pose_body;    // [B, T, J * 3]
  torch::Tensor betas;        // [B, D], undefined if the phase has no shape estimate
  torch::Tensor cam_R;        // [B, T, 3, 3]
  torch::Tensor cam_t;        // [B, T, 3]

  int numTracks() const { return trans.size(0); }
  int numFrames() const { return trans.size(1); }
  bool hasBetas() const { return betas.defined(); }

  // The phase's own camera stream, as stored for one track. Poses only, no intrinsics.
  CameraStream cameraStream(const int track_index) const;
};

// iteration -> block name -> snapshot path, for every "<prefix>_<iteration>_<block>_results.pt"
// in phase_dir. Iterations sort in numeric order because they are zero padded.
using SnapshotIndex = std::map<std::string, std::map<std::string, std::string>>;
SnapshotIndex listResultSnapshots(const std::string& phase_dir);

// Reads one snapshot archive. Throws SnapshotError if it can't be read or is malformed.
PhaseResult loadWorldResult(const std::string& snapshot_path);

// The synthetic "input" phase: the tracker's initial bodies seen from the defining camera.
PhaseResult phaseResultFromDataset(const MotionDataset& dataset);

// Finds what to draw for a phase. Returns nullopt if <log_dir>/<phase> does not exist, which
// callers treat as "skip this phase". A phase directory without a readable world snapshot
// throws SnapshotError.
std::optional<PhaseResult> resolvePhase(
    const std::string& phase, const std::string& log_dir, const MotionDataset& dataset);

}}  // namespace mvis::scene
