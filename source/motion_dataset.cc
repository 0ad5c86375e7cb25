// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "motion_dataset.h"

#include <algorithm>
#include <fstream>

#include "nlohmann/json.hpp"
#include "opencv2/core.hpp"
#include "opencv2/imgcodecs.hpp"
#include "logger.h"
#include "util_file.h"
#include "vis_errors.h"

namespace mvis { namespace scene {

namespace {

using json = nlohmann::json;

json readJsonFile(const std::string& path)
{
  if (!file::fileExists(path)) throw DatasetError("file not found: " + path);
  std::ifstream f(path);
  try {
    return json::parse(f);
  } catch (const json::exception& e) {
    throw DatasetError("cannot parse " + path + ": " + e.what());
  }
}

bool isImageFilename(const std::string& filename)
{
  const std::string ext = file::filenameExtension(filename);
  return ext == "jpg" || ext == "jpeg" || ext == "png";
}

Eigen::VectorXd jsonToVector(const json& j)
{
  const std::vector<double> v = j.get<std::vector<double>>();
  return Eigen::Map<const Eigen::VectorXd>(v.data(), v.size());
}

Eigen::Vector3d jsonToVector3d(const json& j)
{
  const Eigen::VectorXd v = jsonToVector(j);
  if (v.size() != 3) throw DatasetError("expected 3 values, got " + std::to_string(v.size()));
  return v;
}

Eigen::Matrix3d jsonToMatrix3d(const json& j)
{
  if (j.size() != 3) throw DatasetError("expected a 3x3 matrix");
  Eigen::Matrix3d m;
  for (int r = 0; r < 3; ++r) m.row(r) = jsonToVector3d(j[r]).transpose();
  return m;
}

FrameKeypoints jsonToFrameKeypoints(const json& j)
{
  FrameKeypoints kps(j.size(), 3);
  for (int r = 0; r < j.size(); ++r) {
    if (j[r].size() != 3) throw DatasetError("keypoints must be (x, y, confidence) triples");
    for (int c = 0; c < 3; ++c) kps(r, c) = j[r][c].get<float>();
  }
  return kps;
}

std::vector<std::string> selectImagePaths(const RunConfig& cfg)
{
  if (!file::directoryExists(cfg.image_dir)) throw DatasetError("image dir not found: " + cfg.image_dir);
  std::vector<std::string> paths;
  for (const std::string& f : file::getFilesInDir(cfg.image_dir)) {
    if (isImageFilename(f)) paths.push_back(cfg.image_dir + "/" + f);
  }
  const int end = cfg.end_idx < 0 ? int(paths.size()) : std::min<int>(cfg.end_idx, paths.size());
  if (cfg.start_idx >= end) {
    throw DatasetError(
        "no frames selected in " + cfg.image_dir + " for range [" + std::to_string(cfg.start_idx) +
        ", " + std::to_string(cfg.end_idx) + ")");
  }
  return std::vector<std::string>(paths.begin() + cfg.start_idx, paths.begin() + end);
}

void loadTracks(const std::string& tracks_json, MotionDataset& dataset)
{
  const json j = readJsonFile(tracks_json);
  try {
    for (const json& id : j.at("track_ids")) {
      dataset.track_ids.push_back(id.is_string() ? id.get<std::string>() : id.dump());
    }
    dataset.vis_mask = j.at("vis_mask").get<VisibilityMask>();
    for (const json& track : j.at("joints2d")) {
      std::vector<FrameKeypoints> frames;
      for (const json& frame : track) frames.push_back(jsonToFrameKeypoints(frame));
      dataset.joints2d.push_back(std::move(frames));
    }
    if (j.contains("init_body")) {
      for (const json& track : j.at("init_body")) {
        TrackInitBody body;
        for (const json& v : track.at("trans")) body.trans.push_back(jsonToVector3d(v));
        for (const json& v : track.at("root_orient")) body.root_orient.push_back(jsonToVector3d(v));
        for (const json& v : track.at("pose_body")) body.pose_body.push_back(jsonToVector(v));
        if (track.contains("betas")) body.betas = jsonToVector(track.at("betas"));
        dataset.init_body.push_back(std::move(body));
      }
    }
  } catch (const json::exception& e) {
    throw DatasetError("bad tracks file " + tracks_json + ": " + e.what());
  }
}

CameraStream loadCameras(const std::string& cameras_json, const int seq_len, int& width, int& height)
{
  const json j = readJsonFile(cameras_json);
  CameraStream stream;
  try {
    if (j.contains("width")) width = j.at("width").get<int>();
    if (j.contains("height")) height = j.at("height").get<int>();
    for (const json& r : j.at("cam_R")) stream.rotations.push_back(jsonToMatrix3d(r));
    for (const json& t : j.at("cam_t")) stream.translations.push_back(jsonToVector3d(t));
    const json& intrins = j.at("intrins");
    if (!intrins.empty() && intrins.front().is_number()) {
      // One set of intrinsics shared by every frame
      const Eigen::VectorXd k = jsonToVector(intrins);
      if (k.size() != 4) throw DatasetError("intrins must be (fx, fy, cx, cy)");
      stream.intrinsics.assign(seq_len, Eigen::Vector4d(k));
    } else {
      for (const json& k : intrins) {
        const Eigen::VectorXd v = jsonToVector(k);
        if (v.size() != 4) throw DatasetError("intrins must be (fx, fy, cx, cy)");
        stream.intrinsics.push_back(Eigen::Vector4d(v));
      }
    }
  } catch (const json::exception& e) {
    throw DatasetError("bad cameras file " + cameras_json + ": " + e.what());
  }
  return stream;
}

}  // namespace

void MotionDataset::validate() const
{
  auto fail = [&](const std::string& msg) { throw DatasetError(seq_name + ": " + msg); };
  const int num_tracks = numTracks();
  if (seq_len <= 0) fail("empty sequence");
  if (image_paths.size() != seq_len) fail("image count does not match seq_len");
  if (vis_mask.size() != num_tracks) fail("vis_mask has wrong number of tracks");
  if (joints2d.size() != num_tracks) fail("joints2d has wrong number of tracks");
  for (int i = 0; i < num_tracks; ++i) {
    if (vis_mask[i].size() != seq_len) fail("vis_mask of track " + track_ids[i] + " has wrong length");
    if (joints2d[i].size() != seq_len) fail("joints2d of track " + track_ids[i] + " has wrong length");
  }
  if (camera.numFrames() != seq_len || camera.translations.size() != seq_len ||
      camera.intrinsics.size() != seq_len) {
    fail("camera stream does not cover every frame");
  }
  if (hasInitBody()) {
    if (init_body.size() != num_tracks) fail("init_body has wrong number of tracks");
    for (const TrackInitBody& body : init_body) {
      if (body.trans.size() != seq_len || body.root_orient.size() != seq_len ||
          body.pose_body.size() != seq_len) {
        fail("init_body does not cover every frame");
      }
    }
  }
  if (img_width <= 0 || img_height <= 0) fail("unknown image size");
}

CameraStream defaultCameraStream(const int seq_len, const int width, const int height)
{
  const double focal = std::max(width, height);
  CameraStream stream;
  stream.rotations.assign(seq_len, Eigen::Matrix3d::Identity());
  stream.translations.assign(seq_len, Eigen::Vector3d::Zero());
  stream.intrinsics.assign(seq_len, Eigen::Vector4d(focal, focal, 0.5 * width, 0.5 * height));
  return stream;
}

MotionDataset loadMotionDataset(const RunConfig& cfg)
{
  MotionDataset dataset;
  dataset.seq_name = cfg.seq_name;
  dataset.image_paths = selectImagePaths(cfg);
  dataset.seq_len = dataset.image_paths.size();
  XPLINFO << "Loading " << dataset.seq_len << " frames of " << dataset.seq_name << " from " << cfg.image_dir;

  loadTracks(cfg.tracks_json, dataset);

  int width = 0, height = 0;
  if (!cfg.cameras_json.empty()) {
    dataset.camera = loadCameras(cfg.cameras_json, dataset.seq_len, width, height);
  }
  if (width <= 0 || height <= 0) {
    const cv::Mat first = cv::imread(dataset.image_paths[0]);
    if (first.empty()) throw DatasetError("failed to load image file " + dataset.image_paths[0]);
    width = first.cols;
    height = first.rows;
  }
  dataset.img_width = width;
  dataset.img_height = height;
  if (cfg.cameras_json.empty()) {
    XPLINFO << "No camera file, using identity cameras with default intrinsics";
    dataset.camera = defaultCameraStream(dataset.seq_len, width, height);
  }

  dataset.validate();
  return dataset;
}

}}  // namespace mvis::scene
