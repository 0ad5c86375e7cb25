// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <string>

#include "torch/torch.h"
#include "torch/script.h"
#include "vis_config.h"

namespace mvis { namespace scene {

// A flat batch of N body parameter sets, one row per (track, frame).
struct BodyPoseBatch {
  torch::Tensor trans;        // [N, 3]
  torch::Tensor root_orient;  // [N, 3] axis-angle
  torch::Tensor pose_body;    // [N, 3 * body joints] axis-angle
  torch::Tensor betas;        // [N, num betas]

  int64_t size() const { return trans.defined() ? trans.size(0) : 0; }
};

struct BodyModelOutput {
  torch::Tensor vertices;  // [N, V, 3] float, on the CPU
  torch::Tensor faces;     // [F, 3] int64, shared by every row
};

class BodyModelEvaluator {
 public:
  virtual ~BodyModelEvaluator() = default;
  virtual BodyModelOutput evaluate(const BodyPoseBatch& batch) = 0;
};

// A parametric body model exported with TorchScript. forward(trans, root_orient, pose_body,
// betas) returns a (vertices, faces) tuple. Loaded once and reused for every phase of a run.
class TorchScriptBodyModel : public BodyModelEvaluator {
 public:
  // device is resolved by the caller, once per worker.
  TorchScriptBodyModel(const BodyModelConfig& config, const torch::Device device);

  BodyModelOutput evaluate(const BodyPoseBatch& batch) override;

 private:
  BodyModelConfig cfg;
  torch::Device device;
  torch::jit::script::Module module;
};

}}  // namespace mvis::scene
