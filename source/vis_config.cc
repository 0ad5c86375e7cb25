// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "vis_config.h"

#include <filesystem>
#include <fstream>

#include "nlohmann/json.hpp"
#include "logger.h"
#include "util_file.h"
#include "vis_errors.h"

namespace mvis {

namespace {

std::string resolveAgainst(const std::string& log_dir, const std::string& path)
{
  if (path.empty()) return path;
  const std::filesystem::path p(path);
  if (p.is_absolute()) return path;
  return (std::filesystem::path(log_dir) / p).lexically_normal().string();
}

}  // namespace

RunConfig loadRunConfig(const std::string& log_dir, const std::string& sentinel_dir)
{
  using json = nlohmann::json;
  const std::string config_path =
      (std::filesystem::path(log_dir) / sentinel_dir / kRunConfigFilename).string();
  if (!file::fileExists(config_path)) throw ConfigError("missing run config: " + config_path);

  RunConfig cfg;
  cfg.log_dir = log_dir;
  try {
    std::ifstream config_file(config_path);
    const json j = json::parse(config_file);
    const json& data = j.at("data");
    cfg.seq_name = data.value("seq_name", file::lastDirInPath(log_dir));
    cfg.image_dir = resolveAgainst(log_dir, data.at("image_dir").get<std::string>());
    cfg.tracks_json = resolveAgainst(log_dir, data.at("tracks_json").get<std::string>());
    cfg.cameras_json = resolveAgainst(log_dir, data.value("cameras_json", std::string()));
    cfg.start_idx = data.value("start_idx", 0);
    cfg.end_idx = data.value("end_idx", -1);
    cfg.body_model_path = resolveAgainst(log_dir, j.at("paths").at("smpl").get<std::string>());
  } catch (const json::exception& e) {
    throw ConfigError("bad run config " + config_path + ": " + e.what());
  }

  if (cfg.start_idx < 0) throw ConfigError("start_idx must be >= 0 in " + config_path);
  if (cfg.end_idx >= 0 && cfg.end_idx <= cfg.start_idx) {
    throw ConfigError("empty frame range [" + std::to_string(cfg.start_idx) + ", " +
                      std::to_string(cfg.end_idx) + ") in " + config_path);
  }
  return cfg;
}

void BodyModelConfig::validate() const
{
  if (model_path.empty()) throw ConfigError("body model path is empty");
  if (!file::fileExists(model_path)) throw ConfigError("body model not found: " + model_path);
  if (batch_size <= 0) throw ConfigError("body model batch size must be positive");
  if (device_id.empty()) throw ConfigError("body model device id is empty");
}

void VisOptions::validate() const
{
  for (const std::string& phase : phases) {
    if (phase.empty() || phase.find('/') != std::string::npos) {
      throw ConfigError("invalid phase name '" + phase + "'");
    }
  }
}

std::vector<std::string> VisOptions::ignoredByRecorder() const
{
  std::vector<std::string> ignored;
  for (const std::string& view : render_views) {
    if (view != "src_cam") ignored.push_back("render_views=" + view);
  }
  if (grid) ignored.push_back("grid");
  if (render_layers) ignored.push_back("render_layers");
  if (accumulate) ignored.push_back("accumulate");
  return ignored;
}

}  // namespace mvis
