// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

/*
Render every optimization run under a results root into a rerun recording (log.rrd):

motion_vis \
--log_root ~/slahmr_out/davis \
--save_root ~/slahmr_out/vis \
--phases input,motion_chunks \
--gpus 0,1

rerun ~/slahmr_out/vis/dance-run1/log.rrd
*/

#include <cstdlib>

#include "gflags/gflags.h"
#include "batch_launcher.h"
#include "logger.h"
#include "util_file.h"
#include "util_string.h"
#include "vis_errors.h"

DEFINE_string(log_root,       "",              "root directory searched for optimization runs");
DEFINE_string(save_root,      "",              "if not empty, recordings go to <save_root>/<experiment> instead of the run dir");
DEFINE_string(phases,         "motion_chunks", "comma separated phases to draw, in order ('input' draws the tracker initialization)");
DEFINE_string(gpus,           "0",             "comma separated device ids ('cpu' allowed); more than one runs a worker per device");
DEFINE_string(render_views,   "src_cam,front,above,side", "camera views for the offline renderer");
DEFINE_bool(grid,             false,           "offline renderer: tile the views into a grid");
DEFINE_bool(render_layers,    false,           "offline renderer: render each track on its own layer");
DEFINE_bool(render_kps,       false,           "draw 2D skeletons on exported frames");
DEFINE_bool(save_frames,      false,           "also write every input frame as frames/<frame>.png");
DEFINE_bool(accumulate,       false,           "offline renderer: accumulate meshes over time");
DEFINE_bool(overwrite,        false,           "replace existing log.rrd files instead of skipping those runs");
DEFINE_bool(per_phase_camera, false,           "log each phase's camera under world/phase_<name>/camera instead of world/camera");
DEFINE_string(sentinel_dir,   mvis::kDefaultSentinelDir, "a directory containing this subdirectory is a run");
DEFINE_bool(verbose,          false,           "debug logging");

int main(int argc, char** argv)
{
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  if (FLAGS_verbose) mvis::xpl::stdoutLogger.setLevel<mvis::xpl::level::XPL_DEBUG>();

  if (FLAGS_log_root.empty() || !mvis::file::directoryExists(FLAGS_log_root)) {
    XPLERROR << "--log_root must name an existing directory, got '" << FLAGS_log_root << "'";
    return EXIT_FAILURE;
  }

  mvis::BatchRequest batch;
  batch.log_root = FLAGS_log_root;
  batch.save_root = FLAGS_save_root;
  batch.devices = mvis::string::splitNonEmpty(FLAGS_gpus, ',');
  batch.sentinel_dir = FLAGS_sentinel_dir;
  batch.opts.phases = mvis::string::splitNonEmpty(FLAGS_phases, ',');
  batch.opts.render_views = mvis::string::splitNonEmpty(FLAGS_render_views, ',');
  batch.opts.grid = FLAGS_grid;
  batch.opts.render_layers = FLAGS_render_layers;
  batch.opts.render_kps = FLAGS_render_kps;
  batch.opts.save_frames = FLAGS_save_frames;
  batch.opts.accumulate = FLAGS_accumulate;
  batch.opts.overwrite = FLAGS_overwrite;
  batch.opts.per_phase_camera = FLAGS_per_phase_camera;

  if (batch.devices.empty()) {
    XPLERROR << "--gpus is empty";
    return EXIT_FAILURE;
  }
  try {
    batch.opts.validate();
  } catch (const mvis::ConfigError& e) {
    XPLERROR << e.what();
    return EXIT_FAILURE;
  }

  const mvis::BatchReport report = mvis::launchBatch(batch);
  for (const std::string& failed : report.failed) XPLERROR << "FAILED: " << failed;
  return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}
