// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "gtest/gtest.h"
#include "nlohmann/json.hpp"
#include "opencv2/core.hpp"
#include "opencv2/imgcodecs.hpp"
#include "torch/torch.h"
#include "motion_dataset.h"
#include "util_file.h"
#include "util_string.h"
#include "vis_config.h"

namespace mvis { namespace test {

// A fresh directory named after the running test, removed again when it goes out of scope.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(const std::string& suffix = "")
  {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "test";
    if (!suffix.empty()) name += "_" + suffix;
    path_ = (std::filesystem::temp_directory_path() /
             ("motion_vis_" + name + "_" + std::to_string(getpid())))
                .string();
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~ScopedTempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

struct FakeRunLayout {
  int num_tracks = 2;
  int num_frames = 3;
  int width = 64;
  int height = 48;
  scene::VisibilityMask vis_mask;  // empty: every track visible in every frame
  float keypoint_confidence = 0.9f;
  bool with_cameras = true;
  bool with_init_body = true;
  int num_body_joints = 21;
  int num_betas = 10;
};

inline void writeJson(const std::string& path, const nlohmann::json& j)
{
  std::ofstream f(path);
  f << j.dump(2);
}

// A log dir the way the optimizer leaves it: the run config under the sentinel dir, the
// input frames, and the tracker and camera json files.
inline void writeFakeRun(const std::string& log_dir, const FakeRunLayout& layout)
{
  using json = nlohmann::json;
  file::createDirectoryIfNotExists(log_dir + "/" + kDefaultSentinelDir);
  file::createDirectoryIfNotExists(log_dir + "/images");

  for (int f = 0; f < layout.num_frames; ++f) {
    cv::Mat image(layout.height, layout.width, CV_8UC3, cv::Scalar(10 * f, 40, 80));
    cv::imwrite(log_dir + "/images/" + string::intToZeroPad(f, 5) + ".png", image);
  }

  json tracks;
  tracks["track_ids"] = json::array();
  tracks["vis_mask"] = json::array();
  tracks["joints2d"] = json::array();
  tracks["init_body"] = json::array();
  for (int i = 0; i < layout.num_tracks; ++i) {
    tracks["track_ids"].push_back(std::to_string(100 + i));
    tracks["vis_mask"].push_back(
        layout.vis_mask.empty() ? std::vector<int>(layout.num_frames, 1) : layout.vis_mask[i]);
    json frames = json::array();
    json body = {{"trans", json::array()}, {"root_orient", json::array()}, {"pose_body", json::array()}};
    for (int f = 0; f < layout.num_frames; ++f) {
      json joints = json::array();
      for (int j = 0; j < 25; ++j) joints.push_back({10.0 + j + f, 20.0 + j + i, layout.keypoint_confidence});
      frames.push_back(joints);
      body["trans"].push_back({0.1 * i, 0.0, 2.0 + 0.01 * f});
      body["root_orient"].push_back({0.0, 0.0, 0.0});
      body["pose_body"].push_back(std::vector<double>(3 * layout.num_body_joints, 0.0));
    }
    body["betas"] = std::vector<double>(layout.num_betas, 0.0);
    tracks["joints2d"].push_back(frames);
    tracks["init_body"].push_back(body);
  }
  if (!layout.with_init_body) tracks.erase("init_body");
  writeJson(log_dir + "/tracks.json", tracks);

  json data = {{"seq_name", "fake_seq"}, {"image_dir", "images"}, {"tracks_json", "tracks.json"}};
  if (layout.with_cameras) {
    json cameras = {{"cam_R", json::array()}, {"cam_t", json::array()}};
    for (int f = 0; f < layout.num_frames; ++f) {
      cameras["cam_R"].push_back({{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}});
      cameras["cam_t"].push_back({0.0, 0.0, 0.5 * f});
    }
    cameras["intrins"] = {100.0, 100.0, layout.width / 2.0, layout.height / 2.0};
    writeJson(log_dir + "/cameras.json", cameras);
    data["cameras_json"] = "cameras.json";
  }
  writeJson(
      log_dir + "/" + kDefaultSentinelDir + "/" + kRunConfigFilename,
      {{"data", data}, {"paths", {{"smpl", "body_model.pt"}}}});
}

// A phase snapshot whose translations are all trans_value. Track i's camera sits at
// (i, 0, cam_z) so tests can tell which track's stream was drawn.
inline void writeSnapshot(
    const std::string& path,
    const int num_tracks,
    const int num_frames,
    const float trans_value,
    const float cam_z,
    const bool with_betas = true)
{
  torch::serialize::OutputArchive archive;
  archive.write("trans", torch::full({num_tracks, num_frames, 3}, trans_value));
  archive.write("root_orient", torch::zeros({num_tracks, num_frames, 3}));
  archive.write("pose_body", torch::zeros({num_tracks, num_frames, 63}));
  archive.write("cam_R", torch::eye(3).expand({num_tracks, num_frames, 3, 3}).contiguous());
  torch::Tensor cam_t = torch::zeros({num_tracks, num_frames, 3});
  for (int i = 0; i < num_tracks; ++i) {
    cam_t.index_put_({i, torch::indexing::Slice(), 0}, float(i));
    cam_t.index_put_({i, torch::indexing::Slice(), 2}, cam_z);
  }
  archive.write("cam_t", cam_t);
  if (with_betas) archive.write("betas", torch::zeros({num_tracks, 10}));
  archive.save_to(path);
}

}}  // namespace mvis::test
