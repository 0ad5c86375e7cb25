// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "run_vis.h"
#include "vis_config.h"

namespace mvis {

struct BatchRequest {
  std::string log_root;
  std::string save_root;  // empty: each recording is written into its own log dir
  std::vector<std::string> devices = {"0"};
  std::string sentinel_dir = kDefaultSentinelDir;
  VisOptions opts;
};

struct BatchReport {
  int completed = 0;
  int skipped = 0;
  std::vector<std::string> failed;  // log dirs

  bool ok() const { return failed.empty(); }
};

using RunFunction = std::function<RunOutcome(const RunRequest&)>;

// Every directory under log_root that holds a sentinel_dir, sorted.
std::vector<std::string> discoverRuns(const std::string& log_root, const std::string& sentinel_dir);

// Round robin: job i runs on devices[i % devices.size()].
std::string assignDevice(const int job_index, const std::vector<std::string>& devices);

// The first two path components of log_dir below log_root joined by '-', e.g.
// ("/logs", "/logs/seqA/run1/sub") -> "seqA-run1".
std::string experimentName(const std::string& log_root, const std::string& log_dir);

std::string outputDirFor(const std::string& log_root, const std::string& log_dir, const std::string& save_root);

std::vector<RunRequest> planRuns(const BatchRequest& batch);

// Runs every discovered log dir. With more than one device each run gets its own worker process
// and at most devices.size() run at once; otherwise runs execute one after another in this
// process. A failed run is recorded in the report and never stops the others.
BatchReport launchBatch(const BatchRequest& batch, const RunFunction& run = [](const RunRequest& r) {
  return visualizeRun(r);
});

}  // namespace mvis
