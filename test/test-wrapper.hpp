#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

// Every failure ends the test executable with a message on stderr and exit code 1.
#define ERROR(S, ...)                                   \
  do {                                                  \
    fmt::print(stderr, S __VA_OPT__(, ) __VA_ARGS__);   \
    fmt::print(stderr, "\n");                           \
    std::exit(1);                                       \
  } while (0)

#define CHECK(...)                                                                    \
  do {                                                                                \
    if (!(__VA_ARGS__)) ERROR("Check failed: {} ({}:{})", #__VA_ARGS__, __FILE__, __LINE__); \
  } while (0)

#define CHECK_EQ(expected, actual)                                                                             \
  do {                                                                                                         \
    auto const& expected_value = (expected);                                                                   \
    auto const& actual_value = (actual);                                                                       \
    if (!(expected_value == actual_value)) {                                                                   \
      ERROR("Check failed: {} == {}\n Expected: {}\n Got: {} ({}:{})", #expected, #actual, expected_value,     \
            actual_value, __FILE__, __LINE__);                                                                 \
    }                                                                                                          \
  } while (0)

// Prints a banner when a test starts and when it passes (reaching the end of the scope).
struct TestCase {
  std::string test_name;
  explicit TestCase(std::string_view test) : test_name(test) {
    fmt::print("---Starting test: {}\n", test_name);
    fflush(stdout);
  }
  ~TestCase() {
    fmt::print("---Passed test: {}\n", test_name);
    fflush(stdout);
  }
};

// Runs body in a forked child and returns the signal that terminated it, or 0 if it exited normally.
template <class F>
int run_in_child(F&& body) {
  fflush(stdout);
  fflush(stderr);
  pid_t const pid = ::fork();
  if (pid < 0) {
    ERROR("fork failed");
  }
  if (pid == 0) {
    body();
    std::_Exit(0);
  }
  int status = 0;
  if (::waitpid(pid, &status, 0) != pid) {
    ERROR("waitpid failed for child: {}", pid);
  }
  return WIFSIGNALED(status) ? WTERMSIG(status) : 0;
}
