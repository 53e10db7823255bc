#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <gtest/gtest.h>

#include "../src/execbox/utils.h"

namespace {

int ExitCodeInChild(int (*body)()) {
  pid_t pid = fork();
  if (pid == 0) _exit(body());
  int status;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

template <int (*CloseFn)(int)>
int CloseAbove() {
  if (dup2(2, 40) < 0 || dup2(2, 41) < 0 || dup2(2, 60) < 0) return 10;
  if (CloseFn(41) < 0) return 11;
  if (fcntl(40, F_GETFD) < 0) return 12;
  if (fcntl(41, F_GETFD) >= 0 || errno != EBADF) return 13;
  if (fcntl(60, F_GETFD) >= 0 || errno != EBADF) return 14;
  if (fcntl(2, F_GETFD) < 0) return 15;
  return 0;
}

} // namespace

TEST(CloseFrom, ClosesHigherDescriptors) {
  EXPECT_EQ(ExitCodeInChild(CloseAbove<CloseFrom>), 0);
}

TEST(CloseFrom, ProcFsFallback) {
  EXPECT_EQ(ExitCodeInChild(CloseAbove<CloseFromProcFs>), 0);
}
