// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Eigen/Core"
#include "torch/torch.h"
#include "check.h"
#include "logger.h"
#include "vis_errors.h"

#define DEBUG_TENSOR(t) XPLDEBUG << #t ".sizes(): " << (t).sizes()

namespace mvis { namespace util_torch {

inline std::string deviceTypeToString(torch::DeviceType device) {
  switch(device) {
  case torch::kCPU: return "CPU";
  case torch::kCUDA: return "CUDA";
  case torch::kMPS: return "Metal";
  default: return "Unknown Torch Device";
  }
}

// Maps a device id from the command line ("0", "1", ... or "cpu") to a torch device. Without
// CUDA every numeric id falls back to the CPU; with CUDA an index past the last GPU is fatal.
inline torch::Device selectTorchDevice(const std::string& device_id)
{
  if (device_id == "cpu") return torch::Device(torch::kCPU);

  int index = -1;
  try {
    size_t parsed = 0;
    index = std::stoi(device_id, &parsed);
    if (parsed != device_id.size()) index = -1;
  } catch (const std::logic_error&) {
    index = -1;
  }
  if (index < 0) throw DeviceUnavailableError("invalid device id '" + device_id + "'");

  if (!torch::cuda::is_available()) {
    XPLWARN << "CUDA not available, device " << device_id << " runs on the CPU";
    return torch::Device(torch::kCPU);
  }
  const int count = torch::cuda::device_count();
  if (index >= count) {
    throw DeviceUnavailableError(
        "device " + device_id + " requested but only " + std::to_string(count) + " CUDA devices");
  }
  return torch::Device(torch::kCUDA, index);
}

// Throws if t is undefined or its shape does not match. A -1 in sizes matches anything.
inline void checkShape(const torch::Tensor& t, const std::vector<int64_t>& sizes, const std::string& name)
{
  bool ok = t.defined() && t.dim() == int64_t(sizes.size());
  for (int i = 0; ok && i < sizes.size(); ++i) {
    if (sizes[i] >= 0 && t.size(i) != sizes[i]) ok = false;
  }
  if (!ok) {
    std::ostringstream msg;
    msg << name << " has shape ";
    if (t.defined()) msg << t.sizes(); else msg << "<undefined>";
    msg << ", expected [";
    for (int i = 0; i < sizes.size(); ++i) msg << (i ? ", " : "") << sizes[i];
    msg << "]";
    throw std::invalid_argument(msg.str());
  }
}

inline Eigen::Matrix3d toMatrix3d(const torch::Tensor& t)
{
  const torch::Tensor c = t.to(torch::kCPU, torch::kFloat64).contiguous();
  XCHECK_EQ(c.numel(), 9);
  return Eigen::Map<const Eigen::Matrix<double, 3, 3, Eigen::RowMajor>>(c.data_ptr<double>());
}

inline Eigen::Vector3d toVector3d(const torch::Tensor& t)
{
  const torch::Tensor c = t.to(torch::kCPU, torch::kFloat64).contiguous();
  XCHECK_EQ(c.numel(), 3);
  return Eigen::Map<const Eigen::Vector3d>(c.data_ptr<double>());
}

}}  // namespace mvis::util_torch
