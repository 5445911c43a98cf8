#include <unistd.h>

#include <gtest/gtest.h>
#include <gymjudge/errors.h>
#include <gymjudge/cjail_backend.h>

#include "utils.h"

namespace {

bool CanJail() {
  return geteuid() == 0 && FindRuntimeImage("python") && CJailBackend().HasImage("python");
}

} // namespace

TEST(CJailBackendTest, RuntimeImages) {
  for (auto lang : {"python", "markdown", "json"}) {
    auto image = FindRuntimeImage(lang);
    ASSERT_NE(image, nullptr) << lang;
    EXPECT_EQ(image->language, lang);
    EXPECT_FALSE(image->command.empty());
  }
  EXPECT_EQ(FindRuntimeImage("cobol"), nullptr);
  EXPECT_FALSE(CJailBackend().HasImage("cobol"));
}

class CJailRunTest : public testing::Test {
 protected:
  void SetUp() override {
    if (!CanJail()) GTEST_SKIP() << "jailed runs need root and python3";
  }

  RunResult Run(const std::string& code, int time_limit_sec = 5) {
    auto spec = MakeExecutionSpec("jail", time_limit_sec);
    spec.code = code;
    ScopedSandbox box(backend, spec);
    return backend.Wait(box.Handle(), SandboxBackend::Clock::now() + std::chrono::seconds(time_limit_sec));
  }

  CJailBackend backend;
};

TEST_F(CJailRunTest, Output) {
  auto res = Run("print('array sorted')");
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.logs, "array sorted\n");
  EXPECT_GE(res.execution_time_ms, 0);
}

TEST_F(CJailRunTest, ExitCodeAndStderr) {
  auto res = Run("import sys\nsys.stderr.write('boom\\n')\nsys.exit(3)");
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_NE(res.logs.find("boom"), std::string::npos);
}

TEST_F(CJailRunTest, Timeout) {
  auto spec = MakeExecutionSpec("loop", 1);
  spec.code = "while True: pass";
  ScopedSandbox box(backend, spec);
  EXPECT_THROW(backend.Wait(box.Handle(), SandboxBackend::Clock::now() + 1s), TimeoutError);
  backend.Kill(box.Handle());
  backend.Kill(box.Handle());
}

TEST_F(CJailRunTest, NetworkDisabled) {
  auto res = Run("import socket\n"
                 "try:\n"
                 "  socket.create_connection(('1.1.1.1', 53), timeout=1)\n"
                 "  print('online')\n"
                 "except OSError:\n"
                 "  print('offline')\n");
  EXPECT_EQ(res.logs, "offline\n");
}
