// An ordinary program that knows nothing about dlchain. Run with and without the preload payload.
#include <cstdlib>
#include <string_view>

#include "test-wrapper.hpp"
#include "testlib.hpp"

int main() {
  auto const* preload = std::getenv("LD_PRELOAD");
  bool const preloaded =
      preload != nullptr && std::string_view(preload).find("dlchain_preload_payload") != std::string_view::npos;
  TestCase test(preloaded ? "Calls are interposed by the preloaded payload"
                          : "Calls reach the library without a payload");

  auto const calls_before = testlib_calls();
  CHECK_EQ(preloaded ? 41 : 40, testlib_scale(4));
  // The payload always continues to the real implementation
  CHECK_EQ(calls_before + 1, testlib_calls());
  CHECK_EQ(5, testlib_add(2, 3));
}
