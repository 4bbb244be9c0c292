// Registration racing dispatches: no lost or duplicated hooks, order per writer, no writer stalls
#include <algorithm>
#include <atomic>
#include <latch>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "intercepts.hpp"
#include "interceptor.hpp"
#include "test-wrapper.hpp"
#include "testlib.hpp"

namespace {

using AddRegistry = dlchain::Registry<int(int, int)>;
using AddChain = AddRegistry::ChainType;

constexpr int kWriters = 4;
constexpr int kHooksPerWriter = 64;
constexpr int kReaders = 4;

void test_concurrent_registration() {
  TestCase test("Hooks registered from many threads while others dispatch are all kept, in order per thread");
  AddRegistry registry("testlib_add");
  std::atomic<bool> writing{ true };
  std::atomic<long> dispatches{ 0 };
  std::latch start(kWriters + kReaders);

  std::vector<std::thread> readers;
  for (int r = 0; r < kReaders; r++) {
    readers.emplace_back([&] {
      start.arrive_and_wait();
      while (writing.load()) {
        // Every hook passes the arguments through unchanged
        if (registry.dispatch(20, 22) != 42) {
          ERROR("Dispatch observed a corrupted chain");
        }
        dispatches.fetch_add(1);
      }
    });
  }

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; w++) {
    writers.emplace_back([&, w] {
      start.arrive_and_wait();
      for (int i = 0; i < kHooksPerWriter; i++) {
        auto result = registry.add_hook([](int a, int b, AddChain& chain) { return chain.call(a, b); },
                                        dlchain::HookNameMetadata{ .name = fmt::format("hook-{}", i),
                                                                   .namespaze = fmt::format("writer-{}", w) });
        if (!result.has_value()) {
          ERROR("Registration failed: {}", result.error());
        }
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  writing = false;
  for (auto& reader : readers) {
    reader.join();
  }

  auto const names = registry.hook_names();
  CHECK_EQ(static_cast<size_t>(kWriters * kHooksPerWriter), names.size());

  std::set<std::string> unique;
  for (auto const& name : names) {
    unique.insert(fmt::format("{}", name));
  }
  CHECK_EQ(names.size(), unique.size());

  for (int w = 0; w < kWriters; w++) {
    auto const writer = fmt::format("writer-{}", w);
    CHECK_EQ(static_cast<size_t>(kHooksPerWriter),
             registry.count_matching(dlchain::HookNameMetadata{ .namespaze = writer }));
    int expected = 0;
    for (auto const& name : names) {
      if (name.namespaze != writer) continue;
      CHECK_EQ(fmt::format("hook-{}", expected), name.name);
      expected++;
    }
  }
  CHECK(dispatches.load() > 0);
  CHECK_EQ(42, registry.dispatch(20, 22));
}

void test_indices_are_unique() {
  TestCase test("Concurrent registrations report distinct chain positions");
  AddRegistry registry("testlib_add");
  std::latch start(kWriters);
  std::vector<std::vector<size_t>> indices(kWriters);
  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; w++) {
    writers.emplace_back([&, w] {
      start.arrive_and_wait();
      for (int i = 0; i < kHooksPerWriter; i++) {
        auto result = registry.add_hook([](int a, int b, AddChain& chain) { return chain.call(a, b); });
        CHECK(result.has_value());
        indices[w].push_back(result.value().index);
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  std::vector<size_t> all;
  for (auto const& list : indices) {
    CHECK(std::is_sorted(list.begin(), list.end()));
    all.insert(all.end(), list.begin(), list.end());
  }
  std::sort(all.begin(), all.end());
  for (size_t i = 0; i < all.size(); i++) {
    CHECK_EQ(i, all[i]);
  }
}

void test_blocked_hook_does_not_stall_registration() {
  TestCase test("A hook blocked mid-dispatch does not block registration or other dispatches");
  AddRegistry registry("testlib_add");
  std::latch hook_entered(1);
  std::latch release(1);
  std::atomic<bool> block{ true };
  CHECK(registry
            .add_hook([&](int a, int b, AddChain& chain) {
              if (block.exchange(false)) {
                hook_entered.count_down();
                release.wait();
              }
              return chain.call(a, b);
            })
            .has_value());

  int blocked_result = 0;
  std::thread blocked([&] { blocked_result = registry.dispatch(1, 1); });
  hook_entered.wait();

  // The dispatch above is parked inside the first hook; everything below must complete regardless
  CHECK(registry.add_hook([](int a, int b, AddChain& chain) { return chain.call(a, b) * 100; }).has_value());
  CHECK_EQ(2U, registry.hook_count());
  CHECK_EQ(500, registry.dispatch(2, 3));

  release.count_down();
  blocked.join();
  // The parked dispatch keeps walking the list it started with
  CHECK_EQ(2, blocked_result);
}

void test_entry_point_from_many_threads() {
  TestCase test("The entry point dispatches correctly from many threads at once");
  auto& registry = dlchain::symbols::testlib_add();
  // The hook stays on the process-wide registry after this test returns
  auto hook_calls = std::make_shared<std::atomic<int>>(0);
  CHECK(dlchain::AddHook(registry,
                         [hook_calls](int a, int b, AddChain& chain) {
                           hook_calls->fetch_add(1);
                           return chain.call(a, b) + 1;
                         })
            .has_value());

  constexpr int kCalls = 1000;
  std::latch start(kReaders);
  std::vector<std::thread> threads;
  for (int t = 0; t < kReaders; t++) {
    threads.emplace_back([&, t] {
      start.arrive_and_wait();
      for (int i = 0; i < kCalls; i++) {
        if (testlib_add(t, i) != t + i + 1) {
          ERROR("Unexpected result from thread {} call {}", t, i);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  CHECK_EQ(kReaders * kCalls, hook_calls->load());
}

}  // namespace

int main() {
  test_concurrent_registration();
  test_indices_are_unique();
  test_blocked_hook_does_not_stall_registration();
  test_entry_point_from_many_threads();
  puts("CONCURRENCY TESTS PASSED");
}
