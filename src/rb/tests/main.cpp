//
// Copyright (C) 2024 Pablo Delgado Krämer
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <rdx/rb/Arena.h>
#include <rdx/rb/Data.h>
#include <rdx/rb/Enum.h>
#include <rdx/rb/HandleStore.h>
#include <rdx/rb/LinearDataStore.h>
#include <rdx/rb/Log.h>
#include <rdx/rb/LruCache.h>
#include <rdx/rt/TestLogListener.h>

#include <array>
#include <string>
#include <vector>

using namespace rdx;

REGISTER_LISTENER("TestLog", 1, RtTestLogListener);

TEST_CASE("HandleStore.StaleHandleIsInvalid")
{
  RbHandleStore store;

  uint64_t a = store.allocateHandle();
  CHECK(store.isHandleValid(a));
  CHECK_FALSE(store.isHandleValid(0));

  store.freeHandle(a);
  CHECK_FALSE(store.isHandleValid(a));

  // The slot is reused with a new version.
  uint64_t b = store.allocateHandle();
  CHECK_EQ(uint32_t(a), uint32_t(b));
  CHECK_NE(a, b);
  CHECK(store.isHandleValid(b));
  CHECK_FALSE(store.isHandleValid(a));
}

TEST_CASE("HandleStore.AllocatedCount")
{
  RbHandleStore store;

  std::vector<uint64_t> handles;
  for (int i = 0; i < 5; i++)
  {
    handles.push_back(store.allocateHandle());
  }
  store.freeHandle(handles[1]);
  store.freeHandle(handles[3]);

  CHECK_EQ(store.allocatedCount(), 3);

  std::vector<uint64_t> visited;
  store.forEachHandle([&](uint64_t h) { visited.push_back(h); });
  CHECK_EQ(visited, std::vector<uint64_t>{ handles[0], handles[2], handles[4] });
}

TEST_CASE("LinearDataStore.PointersSurviveGrowth")
{
  RbLinearDataStore<std::array<int, 4>> store;

  uint64_t first = store.allocate();
  std::array<int, 4>* firstData;
  REQUIRE(store.get(first, &firstData));
  (*firstData)[0] = 42;

  for (int i = 0; i < 1000; i++)
  {
    store.allocate();
  }

  CHECK_EQ((*firstData)[0], 42);
  CHECK_EQ(store.count(), 1001);
}

TEST_CASE("LinearDataStore.ReusedSlotIsReset")
{
  RbLinearDataStore<int> store;

  uint64_t h = store.allocate();
  int* value;
  REQUIRE(store.get(h, &value));
  *value = 7;
  store.free(h);
  CHECK_FALSE(store.get(h, &value));

  uint64_t h2 = store.allocate();
  REQUIRE(store.get(h2, &value));
  CHECK_EQ(*value, 0);
}

TEST_CASE("LruCache.EvictsLeastRecentlyUsed")
{
  RbLruCache<uint64_t, std::string> cache(4);

  CHECK_FALSE(cache.put(1, "a").has_value());
  CHECK_FALSE(cache.put(2, "b").has_value());
  CHECK_FALSE(cache.put(3, "c").has_value());
  CHECK_FALSE(cache.put(4, "d").has_value());

  // Touch 1 so that 2 becomes the oldest entry.
  REQUIRE(cache.get(1));

  auto evicted = cache.put(5, "e");
  REQUIRE(evicted.has_value());
  CHECK_EQ(evicted->first, 2);
  CHECK_EQ(evicted->second, "b");
  CHECK_EQ(cache.size(), 4);
  CHECK(cache.get(2) == nullptr);
  CHECK_EQ(*cache.get(1), "a");
}

TEST_CASE("LruCache.ReplaceReturnsOldValue")
{
  RbLruCache<uint64_t, int> cache(2);
  cache.put(1, 10);

  auto old = cache.put(1, 11);
  REQUIRE(old.has_value());
  CHECK_EQ(old->second, 10);
  CHECK_EQ(*cache.get(1), 11);
  CHECK_EQ(cache.size(), 1);

  int drained = 0;
  cache.drain([&](uint64_t, int) { drained++; });
  CHECK_EQ(drained, 1);
  CHECK_EQ(cache.size(), 0);
}

TEST_CASE("Arena.AllocationsStayValidAcrossBlocks")
{
  RbArena arena(64);

  std::vector<uint32_t> src = { 1, 2, 3, 4, 5, 6, 7, 8 };
  std::span<const uint32_t> a = arena.copy(std::span<const uint32_t>(src));
  std::span<const uint32_t> b = arena.copy(std::span<const uint32_t>(src));
  std::span<const uint32_t> c = arena.copy(std::span<const uint32_t>(src));

  CHECK_EQ(std::vector<uint32_t>(a.begin(), a.end()), src);
  CHECK_EQ(std::vector<uint32_t>(c.begin(), c.end()), src);
  CHECK_NE(a.data(), b.data());
  CHECK_EQ(arena.bytesUsed(), 3 * 32);

  arena.reset();
  CHECK_EQ(arena.bytesUsed(), 0);

  // Large requests exceeding the block size still succeed.
  std::span<uint64_t> big = arena.allocArray<uint64_t>(100);
  CHECK_EQ(big.size(), 100);
  CHECK_EQ(big[99], 0);
  CHECK(arena.copy(std::span<const int>()).empty());
}

TEST_CASE("Data.CheckedArithmetic")
{
  uint32_t r;
  CHECK(rbCheckedAlignUpwards(33u, 32u, &r));
  CHECK_EQ(r, 64u);
  CHECK(rbCheckedAlignUpwards(5u, 0u, &r));
  CHECK_EQ(r, 5u);
  CHECK_FALSE(rbCheckedAlignUpwards(UINT32_MAX - 2, 64u, &r));
  CHECK_FALSE(rbCheckedMul(UINT32_MAX / 2 + 1, 2u, &r));
  CHECK_FALSE(rbCheckedAdd(UINT32_MAX, 1u, &r));
  CHECK(rbCheckedMul(0u, UINT32_MAX, &r));
  CHECK_EQ(r, 0u);
  CHECK_EQ(rbAlignUpwards(65, 64), 128);
}

namespace
{
  enum class TestFlags : uint32_t
  {
    None = 0,
    A = 1,
    B = 2,
    C = 4
  };
  RB_DECLARE_FLAG_OPS(TestFlags);
}

TEST_CASE("Enum.FlagOps")
{
  TestFlags flags = TestFlags::A;
  flags |= TestFlags::C;

  CHECK(rbHasFlags(flags, TestFlags::A));
  CHECK(rbHasFlags(flags, TestFlags::A | TestFlags::C));
  CHECK_FALSE(rbHasFlags(flags, TestFlags::B));
  CHECK_FALSE(rbHasFlags(flags, TestFlags::A | TestFlags::B));
  CHECK((flags & TestFlags::B) == TestFlags::None);
}

TEST_CASE("Log.EachChannelHasItsOwnLogger")
{
  quill::Logger* base = rbGetLogger(RbLogChannel::Base);
  quill::Logger* gpu = rbGetLogger(RbLogChannel::Gpu);
  quill::Logger* renderer = rbGetLogger(RbLogChannel::Renderer);

  REQUIRE(base);
  REQUIRE(gpu);
  REQUIRE(renderer);
  CHECK_NE(base, gpu);
  CHECK_NE(gpu, renderer);

  CHECK_EQ(gpu->get_logger_name(), std::string(rbLogChannelName(RbLogChannel::Gpu)));
  CHECK(gpu->get_log_level() == base->get_log_level());

  // Repeated initialization keeps the existing loggers.
  rbLogInit(RbLogConfig{ .level = quill::LogLevel::Error });
  CHECK_EQ(rbGetLogger(RbLogChannel::Gpu), gpu);
}

TEST_CASE("Log.ParseLevel")
{
  CHECK(rbParseLogLevel("debug") == quill::LogLevel::Debug);
  CHECK(rbParseLogLevel("warning") == quill::LogLevel::Warning);
  CHECK(rbParseLogLevel("error") == quill::LogLevel::Error);
  CHECK_FALSE(rbParseLogLevel("verbose").has_value());
  CHECK_FALSE(rbParseLogLevel("").has_value());
}
