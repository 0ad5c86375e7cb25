// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "phase_resolver.h"

#include <algorithm>
#include <cctype>

#include "logger.h"
#include "util_file.h"
#include "util_string.h"
#include "util_torch.h"
#include "vis_errors.h"

namespace mvis { namespace scene {

namespace {

constexpr char kSnapshotSuffix[] = "_results.pt";

bool isAllDigits(const std::string& s)
{
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

torch::Tensor readTensor(
    torch::serialize::InputArchive& archive, const std::string& key, const std::string& path)
{
  torch::Tensor t;
  if (!archive.try_read(key, t)) throw SnapshotError(path + " has no '" + key + "'");
  return t.to(torch::kCPU, torch::kFloat32);
}

void checkResultShapes(const PhaseResult& r)
{
  util_torch::checkShape(r.trans, {-1, -1, 3}, "trans");
  const int64_t b = r.trans.size(0);
  const int64_t t = r.trans.size(1);
  util_torch::checkShape(r.root_orient, {b, t, 3}, "root_orient");
  util_torch::checkShape(r.pose_body, {b, t, -1}, "pose_body");
  util_torch::checkShape(r.cam_R, {b, t, 3, 3}, "cam_R");
  util_torch::checkShape(r.cam_t, {b, t, 3}, "cam_t");
  if (r.hasBetas()) util_torch::checkShape(r.betas, {b, -1}, "betas");
}

}  // namespace

CameraStream PhaseResult::cameraStream(const int track_index) const
{
  XCHECK_GE(track_index, 0);
  XCHECK_LT(track_index, numTracks());
  CameraStream stream;
  for (int f = 0; f < numFrames(); ++f) {
    stream.rotations.push_back(util_torch::toMatrix3d(cam_R[track_index][f]));
    stream.translations.push_back(util_torch::toVector3d(cam_t[track_index][f]));
  }
  return stream;
}

SnapshotIndex listResultSnapshots(const std::string& phase_dir)
{
  SnapshotIndex index;
  for (const std::string& filename : file::getFilesInDir(phase_dir)) {
    if (!string::endsWith(filename, kSnapshotSuffix)) continue;
    const std::string stem = filename.substr(0, filename.size() - std::string(kSnapshotSuffix).size());
    const std::vector<std::string> tokens = string::split(stem, '_');
    if (tokens.size() < 3) continue;
    const std::string& block = tokens[tokens.size() - 1];
    const std::string& iteration = tokens[tokens.size() - 2];
    if (!isAllDigits(iteration) || block.empty()) continue;
    index[iteration][block] = phase_dir + "/" + filename;
  }
  return index;
}

PhaseResult loadWorldResult(const std::string& snapshot_path)
{
  PhaseResult r;
  try {
    torch::serialize::InputArchive archive;
    archive.load_from(snapshot_path);
    r.trans = readTensor(archive, "trans", snapshot_path);
    r.root_orient = readTensor(archive, "root_orient", snapshot_path);
    r.pose_body = readTensor(archive, "pose_body", snapshot_path);
    r.cam_R = readTensor(archive, "cam_R", snapshot_path);
    r.cam_t = readTensor(archive, "cam_t", snapshot_path);
    torch::Tensor betas;
    if (archive.try_read("betas", betas)) r.betas = betas.to(torch::kCPU, torch::kFloat32);
    checkResultShapes(r);
  } catch (const c10::Error& e) {
    throw SnapshotError("failed to read " + snapshot_path + ": " + e.msg());
  } catch (const std::invalid_argument& e) {
    throw SnapshotError(snapshot_path + ": " + e.what());
  }
  return r;
}

PhaseResult phaseResultFromDataset(const MotionDataset& dataset)
{
  if (!dataset.hasInitBody()) {
    throw DatasetError(dataset.seq_name + " has no initial body parameters for the input phase");
  }
  const int num_tracks = dataset.numTracks();
  const int num_frames = dataset.seq_len;
  const int pose_dim = dataset.init_body[0].pose_body[0].size();
  const int num_betas = dataset.init_body[0].betas.size();

  auto opts = torch::TensorOptions().dtype(torch::kFloat32);
  PhaseResult r;
  r.phase = kInputPhase;
  r.iteration = kInputIteration;
  r.trans = torch::zeros({num_tracks, num_frames, 3}, opts);
  r.root_orient = torch::zeros({num_tracks, num_frames, 3}, opts);
  r.pose_body = torch::zeros({num_tracks, num_frames, pose_dim}, opts);
  r.cam_R = torch::zeros({num_tracks, num_frames, 3, 3}, opts);
  r.cam_t = torch::zeros({num_tracks, num_frames, 3}, opts);
  if (num_betas > 0) r.betas = torch::zeros({num_tracks, num_betas}, opts);

  auto trans_a = r.trans.accessor<float, 3>();
  auto root_a = r.root_orient.accessor<float, 3>();
  auto pose_a = r.pose_body.accessor<float, 3>();
  auto cam_R_a = r.cam_R.accessor<float, 4>();
  auto cam_t_a = r.cam_t.accessor<float, 3>();
  for (int i = 0; i < num_tracks; ++i) {
    const TrackInitBody& body = dataset.init_body[i];
    if (body.betas.size() != num_betas) throw DatasetError("init_body betas differ between tracks");
    if (num_betas > 0) {
      auto betas_a = r.betas.accessor<float, 2>();
      for (int d = 0; d < num_betas; ++d) betas_a[i][d] = body.betas[d];
    }
    for (int f = 0; f < num_frames; ++f) {
      if (body.pose_body[f].size() != pose_dim) throw DatasetError("init_body pose_body sizes differ");
      for (int k = 0; k < 3; ++k) {
        trans_a[i][f][k] = body.trans[f][k];
        root_a[i][f][k] = body.root_orient[f][k];
        cam_t_a[i][f][k] = dataset.camera.translations[f][k];
        for (int c = 0; c < 3; ++c) cam_R_a[i][f][k][c] = dataset.camera.rotations[f](k, c);
      }
      for (int k = 0; k < pose_dim; ++k) pose_a[i][f][k] = body.pose_body[f][k];
    }
  }
  return r;
}

std::optional<PhaseResult> resolvePhase(
    const std::string& phase, const std::string& log_dir, const MotionDataset& dataset)
{
  if (phase == kInputPhase) return phaseResultFromDataset(dataset);

  const std::string phase_dir = log_dir + "/" + phase;
  if (!file::directoryExists(phase_dir)) {
    XPLINFO << phase_dir << " does not exist, skipping";
    return std::nullopt;
  }

  const SnapshotIndex index = listResultSnapshots(phase_dir);
  if (index.empty()) throw SnapshotError("no result snapshots in " + phase_dir);
  const auto& [iteration, blocks] = *index.rbegin();
  const auto world = blocks.find(kWorldBlock);
  if (world == blocks.end()) {
    throw SnapshotError("iteration " + iteration + " in " + phase_dir + " has no world result");
  }

  XPLINFO << "phase " << phase << ": iteration " << iteration << " from " << world->second;
  PhaseResult r = loadWorldResult(world->second);
  r.phase = phase;
  r.iteration = iteration;
  if (r.numTracks() != dataset.numTracks() || r.numFrames() != dataset.seq_len) {
    throw SnapshotError(
        world->second + " has " + std::to_string(r.numTracks()) + " tracks and " +
        std::to_string(r.numFrames()) + " frames, the dataset has " +
        std::to_string(dataset.numTracks()) + " and " + std::to_string(dataset.seq_len));
  }
  return r;
}

}}  // namespace mvis::scene
