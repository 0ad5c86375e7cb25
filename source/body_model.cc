// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "body_model.h"

#include "logger.h"
#include "util_torch.h"

namespace mvis { namespace scene {

TorchScriptBodyModel::TorchScriptBodyModel(const BodyModelConfig& config, const torch::Device torch_device)
    : cfg(config), device(torch_device)
{
  cfg.validate();
  torch::NoGradGuard no_grad;
  XPLINFO << "body model: " << cfg.model_path << " on "
          << util_torch::deviceTypeToString(device.type()) << ", batch size " << cfg.batch_size;
  try {
    module = torch::jit::load(cfg.model_path, device);
  } catch (const c10::Error& e) {
    XCHECK(false) << "Error loading torch module: " << cfg.model_path << "\n" << e.msg();
  }
  module.eval();
}

BodyModelOutput TorchScriptBodyModel::evaluate(const BodyPoseBatch& batch)
{
  const int64_t n = batch.size();
  XCHECK_EQ(n, cfg.batch_size) << "body model was configured for a different batch";
  util_torch::checkShape(batch.trans, {n, 3}, "trans");
  util_torch::checkShape(batch.root_orient, {n, 3}, "root_orient");
  util_torch::checkShape(batch.pose_body, {n, -1}, "pose_body");
  util_torch::checkShape(batch.betas, {n, -1}, "betas");

  torch::NoGradGuard no_grad;
  auto toDevice = [&](const torch::Tensor& t) { return t.to(device, torch::kFloat32); };
  std::vector<torch::jit::IValue> inputs = {
      toDevice(batch.trans), toDevice(batch.root_orient), toDevice(batch.pose_body), toDevice(batch.betas)};

  BodyModelOutput out;
  try {
    auto tup = module.forward(inputs).toTuple();
    XCHECK_EQ(tup->elements().size(), 2) << "body model must return (vertices, faces)";
    out.vertices = tup->elements()[0].toTensor().detach().to(torch::kCPU, torch::kFloat32).contiguous();
    out.faces = tup->elements()[1].toTensor().detach().to(torch::kCPU, torch::kInt64).contiguous();
  } catch (const c10::Error& e) {
    XCHECK(false) << "body model forward failed: " << e.msg();
  }
  util_torch::checkShape(out.vertices, {n, -1, 3}, "vertices");
  util_torch::checkShape(out.faces, {-1, 3}, "faces");
  DEBUG_TENSOR(out.vertices);
  return out;
}

}}  // namespace mvis::scene
