#include <stdlib.h>
#include <chrono>
#include <thread>
#include <fstream>
#include <gtest/gtest.h>
#include <execbox/paths.h>
#include <execbox/executor.h>

#include "utils.h"

class ProcessExecutorTest : public testing::Test {
  long max_output_;
  std::vector<std::string> interpreter_;
 protected:
  void SetUp() override {
    max_output_ = kMaxOutputBytes;
    interpreter_ = kInterpreter;
  }
  void TearDown() override {
    kMaxOutputBytes = max_output_;
    kInterpreter = interpreter_;
  }
};

TEST_F(ProcessExecutorTest, Hello) {
  auto res = RunCode("print(\"hello\")");
  EXPECT_EQ(res.output, "hello\n");
  EXPECT_EQ(res.error, "");
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_FALSE(res.timed_out);
  EXPECT_FALSE(res.output_truncated);
}

TEST_F(ProcessExecutorTest, Stdin) {
  auto res = RunCode("import sys\nfor line in sys.stdin:\n    print(line.strip().upper())\n", "abc\ndef\n");
  EXPECT_EQ(res.output, "ABC\nDEF\n");
  EXPECT_EQ(res.exit_code, 0);
}

TEST_F(ProcessExecutorTest, IgnoredLargeStdin) {
  auto res = RunCode("print('done')", std::string(4 << 20, 'x'));
  EXPECT_EQ(res.output, "done\n");
  EXPECT_EQ(res.exit_code, 0);
}

TEST_F(ProcessExecutorTest, NonzeroExit) {
  auto res = RunCode("import sys\nprint('partial')\nsys.exit(3)");
  EXPECT_EQ(res.output, "partial\n");
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.signal, 0);
}

TEST_F(ProcessExecutorTest, UncaughtException) {
  auto res = RunCode("raise ValueError('boom')");
  EXPECT_EQ(res.exit_code, 1);
  EXPECT_NE(res.error.find("ValueError: boom"), std::string::npos) << res.error;
}

TEST_F(ProcessExecutorTest, KilledBySignal) {
  auto res = RunCode("import os, signal\nos.kill(os.getpid(), signal.SIGKILL)");
  EXPECT_EQ(res.signal, 9);
  EXPECT_EQ(res.exit_code, 128 + 9);
  EXPECT_FALSE(res.timed_out);
}

TEST_F(ProcessExecutorTest, Timeout) {
  auto res = RunCode("import time\nprint('before', flush=True)\ntime.sleep(200)", "", 3000);
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.exit_code, kTimeoutExitCode);
  EXPECT_EQ(res.output, "before\n");
  std::string marker = "\nExecution timed out after 3s";
  ASSERT_GE(res.error.size(), marker.size());
  EXPECT_EQ(res.error.substr(res.error.size() - marker.size()), marker);
  EXPECT_GE(res.wall_time, 2'900'000);
  EXPECT_LT(res.wall_time, 6'000'000);
}

TEST_F(ProcessExecutorTest, StrayChildrenKilled) {
  auto res = RunCode("import os, time\nif os.fork() == 0:\n    time.sleep(60)\nelse:\n    print('parent')\n");
  EXPECT_EQ(res.output, "parent\n");
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_FALSE(res.timed_out);
  EXPECT_LT(res.wall_time, 5'000'000);
}

TEST_F(ProcessExecutorTest, StrayChildrenDeadAfterRun) {
  auto res = RunCode("import os, time\npid = os.fork()\nif pid == 0:\n    time.sleep(60)\nelse:\n    print(pid)\n");
  ASSERT_EQ(res.exit_code, 0);
  std::string stat_path = "/proc/" + std::to_string(std::stol(res.output)) + "/stat";
  // gone, or a zombie waiting for init
  auto Dead = [&]() {
    std::string stat = ReadFile(stat_path);
    if (stat.empty()) return true;
    size_t pos = stat.rfind(')');
    return pos != std::string::npos && pos + 2 < stat.size() &&
           (stat[pos + 2] == 'Z' || stat[pos + 2] == 'X');
  };
  for (int i = 0; i < 20 && !Dead(); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  EXPECT_TRUE(Dead());
}

TEST_F(ProcessExecutorTest, OutputTruncated) {
  auto res = RunCode("import sys\nsys.stdout.write('a' * 3_000_000)\nsys.stderr.write('short')");
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_TRUE(res.output_truncated);
  EXPECT_FALSE(res.error_truncated);
  std::string marker = TruncationMarker(kMaxOutputBytes);
  EXPECT_EQ(marker, "\n\n[TRUNCATED] Output exceeded 2 MB limit.");
  EXPECT_EQ(res.output.size(), (size_t)kMaxOutputBytes + marker.size());
  EXPECT_EQ(res.output.substr(kMaxOutputBytes), marker);
  EXPECT_EQ(res.error, "short");
}

TEST_F(ProcessExecutorTest, TruncationKeepsUtf8) {
  kMaxOutputBytes = 10;
  auto res = RunCode("import sys\nsys.stdout.write('a' + '\\u00e9' * 20)");
  EXPECT_TRUE(res.output_truncated);
  EXPECT_EQ(res.output.substr(0, 9), "a\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9");
  EXPECT_EQ(res.output.substr(9), TruncationMarker(10));
}

TEST_F(ProcessExecutorTest, ExactlyAtLimit) {
  kMaxOutputBytes = 10;
  auto res = RunCode("import sys\nsys.stdout.write('0123456789')");
  EXPECT_FALSE(res.output_truncated);
  EXPECT_EQ(res.output, "0123456789");
}

TEST_F(ProcessExecutorTest, TransientDirectoryRemoved) {
  size_t before = CountEntries(kWorkRoot);
  for (int i = 0; i < 3; i++) {
    auto res = RunCode("open('scratch.txt', 'w').write('x')\nprint('ok')");
    EXPECT_EQ(res.output, "ok\n");
  }
  auto res = RunCode("raise SystemExit(2)");
  EXPECT_EQ(res.exit_code, 2);
  EXPECT_EQ(CountEntries(kWorkRoot), before);
}

TEST_F(ProcessExecutorTest, SessionDirectoryPersists) {
  fs::path workdir = kWorkRoot / "persist_test";
  ASSERT_TRUE(fs::create_directories(workdir));
  ProcessExecutor executor;
  ExecutionJob job;
  job.workdir = workdir;
  job.stateless = false;
  job.timeout_ms = 10'000;
  job.code = "with open('state.txt', 'w') as f:\n    f.write('42')\n";
  EXPECT_EQ(executor.Run(job).exit_code, 0);
  job.code = "print(open('state.txt').read())";
  auto res = executor.Run(job);
  EXPECT_EQ(res.output, "42\n");
  // only the file written by the code remains; the scripts are gone
  EXPECT_EQ(CountEntries(workdir), 1);
  EXPECT_EQ(ReadFile(workdir / "state.txt"), "42");
  fs::remove_all(workdir);
}

TEST_F(ProcessExecutorTest, Environment) {
  setenv("SUPABASE_URL", "https://example.invalid", 1);
  setenv("SUPABASE_SERVICE_ROLE_KEY", "role-key", 1);
  setenv("EXECBOX_TEST_API_KEY", "secret", 1);
  setenv("execbox_test_token", "secret", 1);
  setenv("EXECBOX_TEST_PLAIN", "visible", 1);
  auto res = RunCode(
      "import os\n"
      "for k in ['SUPABASE_URL', 'SUPABASE_SERVICE_ROLE_KEY', 'EXECBOX_TEST_API_KEY',\n"
      "          'execbox_test_token', 'EXECBOX_TEST_PLAIN']:\n"
      "    print(k, os.environ.get(k))\n"
      "cwd = os.path.realpath(os.getcwd())\n"
      "print(os.path.realpath(os.environ['HOME']) == cwd)\n"
      "print(os.path.realpath(os.environ['MPLCONFIGDIR']) == cwd)\n"
      "print(os.path.realpath(os.environ['PYTHONPATH'].split(':')[0]) == cwd)\n"
      "print(os.environ['PYTHONIOENCODING'])\n");
  unsetenv("SUPABASE_URL");
  unsetenv("SUPABASE_SERVICE_ROLE_KEY");
  unsetenv("EXECBOX_TEST_API_KEY");
  unsetenv("execbox_test_token");
  unsetenv("EXECBOX_TEST_PLAIN");
  EXPECT_EQ(res.error, "");
  EXPECT_EQ(res.output,
            "SUPABASE_URL None\n"
            "SUPABASE_SERVICE_ROLE_KEY None\n"
            "EXECBOX_TEST_API_KEY None\n"
            "execbox_test_token None\n"
            "EXECBOX_TEST_PLAIN visible\n"
            "True\nTrue\nTrue\nutf-8\n");
}

TEST_F(ProcessExecutorTest, ModulesImportableFromWorkdir) {
  fs::path workdir = kWorkRoot / "module_test";
  ASSERT_TRUE(fs::create_directories(workdir));
  std::ofstream(workdir / "helper.py") << "VALUE = 7\n";
  ProcessExecutor executor;
  ExecutionJob job;
  job.workdir = workdir;
  job.stateless = false;
  job.timeout_ms = 10'000;
  job.code = "import helper\nprint(helper.VALUE)";
  EXPECT_EQ(executor.Run(job).output, "7\n");
  fs::remove_all(workdir);
}

TEST_F(ProcessExecutorTest, ConcurrentIsolation) {
  constexpr int kThreads = 4;
  std::vector<ExecutionResult> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&results, i]() {
      results[i] = RunCode(
          "import os, time\n"
          "open('mine.txt', 'w').write('" + std::to_string(i) + "')\n"
          "time.sleep(0.3)\n"
          "print([f for f in os.listdir('.') if not f.startswith('script_')], open('mine.txt').read())\n");
    });
  }
  for (auto& i : threads) i.join();
  for (int i = 0; i < kThreads; i++) {
    EXPECT_EQ(results[i].output, "['mine.txt'] " + std::to_string(i) + "\n") << results[i].error;
  }
}

TEST_F(ProcessExecutorTest, MissingInterpreter) {
  kInterpreter = {"/nonexistent/python3"};
  size_t before = CountEntries(kWorkRoot);
  EXPECT_THROW(RunCode("print(1)"), ExecutionError);
  EXPECT_EQ(CountEntries(kWorkRoot), before);
  kInterpreter = {"python3"};
  EXPECT_THROW(RunCode("print(1)"), ExecutionError);
}

TEST(TruncateUtf8, Boundaries) {
  std::string str = "abc";
  EXPECT_FALSE(TruncateUtf8(str, 3));
  EXPECT_EQ(str, "abc");
  EXPECT_TRUE(TruncateUtf8(str, 2));
  EXPECT_EQ(str, "ab");

  // U+20AC is 3 bytes
  str = "a\xe2\x82\xac" "b";
  EXPECT_TRUE(TruncateUtf8(str, 3));
  EXPECT_EQ(str, "a");
  str = "a\xe2\x82\xac" "b";
  EXPECT_TRUE(TruncateUtf8(str, 4));
  EXPECT_EQ(str, "a\xe2\x82\xac");

  // not UTF-8; cut at the byte limit
  str = std::string(8, '\x80');
  EXPECT_TRUE(TruncateUtf8(str, 6));
  EXPECT_EQ(str.size(), 6);
}

TEST(Markers, Format) {
  EXPECT_EQ(TimeoutMarker(3000), "\nExecution timed out after 3s");
  EXPECT_EQ(TimeoutMarker(1500), "\nExecution timed out after 1.5s");
  EXPECT_EQ(TruncationMarker(1 << 20), "\n\n[TRUNCATED] Output exceeded 1 MB limit.");
}
