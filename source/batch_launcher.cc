// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
#include "batch_launcher.h"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>

#include "logger.h"
#include "util_file.h"
#include "util_string.h"

namespace mvis {

namespace {

constexpr char kDeviceEnvVar[] = "EGL_DEVICE_ID";

// Worker process exit codes
constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitSkipped = 2;

void setDeviceEnv(const std::string& device)
{
  XCHECK_EQ(setenv(kDeviceEnvVar, device.c_str(), 1), 0) << std::strerror(errno);
}

void tally(BatchReport& report, const RunRequest& req, const int exit_code)
{
  switch (exit_code) {
  case kExitCompleted: ++report.completed; break;
  case kExitSkipped: ++report.skipped; break;
  default:
    XPLERROR << "Run failed: " << req.log_dir;
    report.failed.push_back(req.log_dir);
  }
}

int runToExitCode(const RunFunction& run, const RunRequest& req)
{
  try {
    setDeviceEnv(req.device_id);
    return run(req) == RunOutcome::kSkipped ? kExitSkipped : kExitCompleted;
  } catch (const std::exception& e) {
    XPLERROR << req.log_dir << ": " << e.what();
    return kExitFailed;
  }
}

BatchReport launchSequential(const std::vector<RunRequest>& runs, const RunFunction& run)
{
  BatchReport report;
  for (const RunRequest& req : runs) tally(report, req, runToExitCode(run, req));
  return report;
}

int waitForChild(pid_t& pid)
{
  int status = 0;
  do {
    pid = waitpid(-1, &status, 0);
  } while (pid < 0 && errno == EINTR);
  XCHECK_GE(pid, 0) << "waitpid failed: " << std::strerror(errno);
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  XPLERROR << "worker " << pid << " terminated abnormally (status " << status << ")";
  return kExitFailed;
}

BatchReport launchWorkerPool(
    const std::vector<RunRequest>& runs, const RunFunction& run, const int max_workers)
{
  BatchReport report;
  std::map<pid_t, int> running;  // pid -> index into runs
  int next = 0;
  while (next < runs.size() || !running.empty()) {
    if (next < runs.size() && running.size() < max_workers) {
      // Anything still buffered would otherwise be printed again by the child.
      std::cout.flush();
      std::cerr.flush();
      const pid_t pid = fork();
      XCHECK_GE(pid, 0) << "fork failed: " << std::strerror(errno);
      if (pid == 0) {
        const int code = runToExitCode(run, runs[next]);
        std::cout.flush();
        _exit(code);
      }
      XPLINFO << "worker " << pid << ": " << runs[next].log_dir << " on device " << runs[next].device_id;
      running[pid] = next++;
      continue;
    }

    pid_t pid = -1;
    const int code = waitForChild(pid);
    const auto it = running.find(pid);
    if (it == running.end()) continue;
    tally(report, runs[it->second], code);
    running.erase(it);
  }
  return report;
}

}  // namespace

std::vector<std::string> discoverRuns(const std::string& log_root, const std::string& sentinel_dir)
{
  return file::findDirsContaining(log_root, sentinel_dir);
}

std::string assignDevice(const int job_index, const std::vector<std::string>& devices)
{
  XCHECK(!devices.empty()) << "no devices";
  XCHECK_GE(job_index, 0);
  return devices[job_index % devices.size()];
}

std::string experimentName(const std::string& log_root, const std::string& log_dir)
{
  std::vector<std::string> parts = file::relativePathComponents(log_root, log_dir);
  if (parts.size() > 2) parts.resize(2);
  if (parts.empty()) return file::lastDirInPath(log_dir);
  return string::join(parts, '-');
}

std::string outputDirFor(const std::string& log_root, const std::string& log_dir, const std::string& save_root)
{
  if (save_root.empty()) return log_dir;
  return save_root + "/" + experimentName(log_root, log_dir);
}

std::vector<RunRequest> planRuns(const BatchRequest& batch)
{
  std::vector<RunRequest> runs;
  const std::vector<std::string> log_dirs = discoverRuns(batch.log_root, batch.sentinel_dir);
  for (int i = 0; i < log_dirs.size(); ++i) {
    RunRequest req;
    req.log_dir = log_dirs[i];
    req.save_dir = outputDirFor(batch.log_root, log_dirs[i], batch.save_root);
    req.device_id = assignDevice(i, batch.devices);
    req.sentinel_dir = batch.sentinel_dir;
    req.opts = batch.opts;
    runs.push_back(req);
  }
  return runs;
}

BatchReport launchBatch(const BatchRequest& batch, const RunFunction& run)
{
  XCHECK(!batch.devices.empty()) << "at least one device is required";
  const std::vector<RunRequest> runs = planRuns(batch);
  XPLINFO << "Found " << runs.size() << " runs to render under " << batch.log_root;

  BatchReport report = batch.devices.size() > 1
      ? launchWorkerPool(runs, run, batch.devices.size())
      : launchSequential(runs, run);
  XPLINFO << report.completed << " completed, " << report.skipped << " skipped, "
          << report.failed.size() << " failed";
  return report;
}

}  // namespace mvis
