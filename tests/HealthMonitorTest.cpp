////////////////////////////////////////////////////////////////////////////////
/// @brief tests for the periodic health refresh
///
/// @file
///
/// DISCLAIMER
///
/// Copyright 2015 ArangoDB GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
///
/// @author Dr. Frank Celler
/// @author Copyright 2015, ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#include "HealthMonitor.h"

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <set>
#include <thread>

using namespace neo4j;
using namespace std;

namespace {
  bool waitFor (const function<bool ()>& predicate) {
    auto deadline = chrono::steady_clock::now() + chrono::seconds(5);

    while (chrono::steady_clock::now() < deadline) {
      if (predicate()) {
        return true;
      }

      this_thread::sleep_for(chrono::milliseconds(5));
    }

    return predicate();
  }
}

TEST(HealthMonitor, CallsWatchedClusters) {
  mutex lock;
  multiset<string> seen;

  HealthMonitor monitor(chrono::milliseconds(10), [&] (const string& key) {
    lock_guard<mutex> guard(lock);
    seen.insert(key);
  });

  monitor.watch("prod/a");
  monitor.watch("prod/b");
  monitor.watch("prod/a");
  EXPECT_TRUE(monitor.watching("prod/a"));

  monitor.start();
  ASSERT_TRUE(waitFor([&monitor] () { return monitor.ticks() >= 2; }));
  monitor.stop();

  lock_guard<mutex> guard(lock);
  EXPECT_LE(2u, seen.count("prod/a"));
  EXPECT_EQ(seen.count("prod/a"), seen.count("prod/b"));
}

TEST(HealthMonitor, UnwatchedClustersAreSkipped) {
  atomic<int> calls(0);

  HealthMonitor monitor(chrono::milliseconds(10), [&calls] (const string&) {
    ++calls;
  });

  monitor.watch("prod/a");
  monitor.unwatch("prod/a");
  EXPECT_FALSE(monitor.watching("prod/a"));

  monitor.start();
  ASSERT_TRUE(waitFor([&monitor] () { return monitor.ticks() >= 2; }));
  monitor.stop();

  EXPECT_EQ(0, calls.load());
}

TEST(HealthMonitor, StopWakesImmediately) {
  HealthMonitor monitor(chrono::hours(1), [] (const string&) {
  });

  monitor.start();
  monitor.start();
  EXPECT_TRUE(monitor.running());

  auto start = chrono::steady_clock::now();
  monitor.stop();

  EXPECT_GT(chrono::seconds(5), chrono::steady_clock::now() - start);
  EXPECT_FALSE(monitor.running());
  EXPECT_EQ(0u, monitor.ticks());

  monitor.stop();
}

TEST(HealthMonitor, CanBeRestarted) {
  atomic<int> calls(0);

  HealthMonitor monitor(chrono::milliseconds(5), [&calls] (const string&) {
    ++calls;
  });

  monitor.watch("prod/a");
  monitor.start();
  monitor.stop();
  monitor.start();

  ASSERT_TRUE(waitFor([&calls] () { return calls.load() > 0; }));
  monitor.stop();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
