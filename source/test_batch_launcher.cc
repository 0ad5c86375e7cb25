// MIT License. Copyright (c) 2025 Lifecast Incorporated. Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions: The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software. THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include <signal.h>
#include <unistd.h>
#include <cstdlib>
#include <set>

#include "gtest/gtest.h"
#include "batch_launcher.h"
#include "check.h"
#include "test_run_fixture.h"

namespace mvis { namespace {

void makeRunDir(const std::string& dir) { file::createDirectoryIfNotExists(dir + "/" + kDefaultSentinelDir); }

TEST(BatchLauncher, devices_are_assigned_round_robin)
{
  const std::vector<std::string> devices = {"0", "1"};
  EXPECT_EQ(assignDevice(0, devices), "0");
  EXPECT_EQ(assignDevice(1, devices), "1");
  EXPECT_EQ(assignDevice(2, devices), "0");
  EXPECT_EQ(assignDevice(3, devices), "1");
  EXPECT_EQ(assignDevice(4, devices), "0");
  EXPECT_EQ(assignDevice(5, {"cpu"}), "cpu");
  EXPECT_THROW(assignDevice(0, {}), CheckFailedError);
}

TEST(BatchLauncher, experiment_name_is_first_two_components)
{
  EXPECT_EQ(experimentName("/logs", "/logs/davis/dance-2024/slahmr"), "davis-dance-2024");
  EXPECT_EQ(experimentName("/logs/", "/logs/davis/run"), "davis-run");
  EXPECT_EQ(experimentName("/logs", "/logs/single"), "single");
  EXPECT_EQ(experimentName("/logs/root", "/logs/root"), "root");
}

TEST(BatchLauncher, output_dir)
{
  EXPECT_EQ(outputDirFor("/logs", "/logs/a/b/c", ""), "/logs/a/b/c");
  EXPECT_EQ(outputDirFor("/logs", "/logs/a/b/c", "/vis"), "/vis/a-b");
}

TEST(BatchLauncher, discovers_every_run_dir)
{
  test::ScopedTempDir tmp;
  const std::string root = tmp.path();
  makeRunDir(root + "/seq_a/run1");
  makeRunDir(root + "/seq_a/run2");
  makeRunDir(root + "/seq_b");
  file::createDirectoryIfNotExists(root + "/seq_c/not_a_run");
  // Nothing inside a sentinel dir counts as a run.
  makeRunDir(root + "/seq_b/" + kDefaultSentinelDir + "/nested");

  const std::vector<std::string> runs = discoverRuns(root, kDefaultSentinelDir);
  ASSERT_EQ(runs.size(), 3);
  EXPECT_EQ(runs[0], root + "/seq_a/run1");
  EXPECT_EQ(runs[1], root + "/seq_a/run2");
  EXPECT_EQ(runs[2], root + "/seq_b");
}

TEST(BatchLauncher, plan_fills_every_request)
{
  test::ScopedTempDir tmp;
  makeRunDir(tmp.path() + "/x/r1");
  makeRunDir(tmp.path() + "/x/r2");
  makeRunDir(tmp.path() + "/y/r3");

  BatchRequest batch;
  batch.log_root = tmp.path();
  batch.save_root = tmp.path() + "/vis";
  batch.devices = {"0", "1"};
  batch.opts.phases = {"input"};
  const std::vector<RunRequest> runs = planRuns(batch);
  ASSERT_EQ(runs.size(), 3);
  EXPECT_EQ(runs[0].save_dir, tmp.path() + "/vis/x-r1");
  EXPECT_EQ(runs[2].save_dir, tmp.path() + "/vis/y-r3");
  EXPECT_EQ(runs[0].device_id, "0");
  EXPECT_EQ(runs[1].device_id, "1");
  EXPECT_EQ(runs[2].device_id, "0");
  EXPECT_EQ(runs[1].opts.phases, std::vector<std::string>({"input"}));
}

class LaunchTest : public ::testing::Test {
 protected:
  test::ScopedTempDir tmp;
  BatchRequest batch;

  void SetUp() override
  {
    for (const std::string& name : {"a", "b", "c", "d"}) makeRunDir(tmp.path() + "/" + name);
    batch.log_root = tmp.path();
  }

  // Fails on run "b", skips run "d".
  static RunOutcome fakeRun(const RunRequest& req)
  {
    const char* device = std::getenv("EGL_DEVICE_ID");
    XCHECK(device != nullptr && req.device_id == device) << "device env not set for " << req.log_dir;
    const std::string name = file::lastDirInPath(req.log_dir);
    if (name == "b") throw std::runtime_error("boom");
    if (name == "d") return RunOutcome::kSkipped;
    return RunOutcome::kCompleted;
  }
};

TEST_F(LaunchTest, sequential_failure_does_not_stop_other_runs)
{
  batch.devices = {"0"};
  std::vector<std::string> visited;
  const BatchReport report = launchBatch(batch, [&](const RunRequest& req) {
    visited.push_back(file::lastDirInPath(req.log_dir));
    return fakeRun(req);
  });
  EXPECT_EQ(visited, std::vector<std::string>({"a", "b", "c", "d"}));
  EXPECT_EQ(report.completed, 2);
  EXPECT_EQ(report.skipped, 1);
  ASSERT_EQ(report.failed.size(), 1);
  EXPECT_EQ(report.failed[0], tmp.path() + "/b");
  EXPECT_FALSE(report.ok());
}

TEST_F(LaunchTest, check_failure_is_a_run_failure)
{
  batch.devices = {"cpu"};
  const BatchReport report = launchBatch(batch, [](const RunRequest& req) {
    XCHECK(file::lastDirInPath(req.log_dir) != "c") << "bad run";
    return RunOutcome::kCompleted;
  });
  EXPECT_EQ(report.completed, 3);
  EXPECT_EQ(report.failed, std::vector<std::string>({tmp.path() + "/c"}));
}

TEST_F(LaunchTest, worker_processes_isolate_failures)
{
  batch.devices = {"0", "1"};
  const BatchReport report = launchBatch(batch, &LaunchTest::fakeRun);
  EXPECT_EQ(report.completed, 2);
  EXPECT_EQ(report.skipped, 1);
  ASSERT_EQ(report.failed.size(), 1);
  EXPECT_EQ(report.failed[0], tmp.path() + "/b");
}

TEST_F(LaunchTest, crashed_worker_is_a_failure)
{
  batch.devices = {"0", "1", "2"};
  const BatchReport report = launchBatch(batch, [](const RunRequest& req) {
    if (file::lastDirInPath(req.log_dir) == "a") kill(getpid(), SIGKILL);
    return RunOutcome::kCompleted;
  });
  EXPECT_EQ(report.completed, 3);
  EXPECT_EQ(report.failed, std::vector<std::string>({tmp.path() + "/a"}));
}

TEST_F(LaunchTest, nothing_to_do)
{
  test::ScopedTempDir empty("empty");
  batch.log_root = empty.path();
  const BatchReport report = launchBatch(batch, &LaunchTest::fakeRun);
  EXPECT_EQ(report.completed + report.skipped, 0);
  EXPECT_TRUE(report.ok());
}

}}  // namespace mvis::
