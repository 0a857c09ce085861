////////////////////////////////////////////////////////////////////////////////
/// @brief periodic health refresh
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

#include <vector>

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

HealthMonitor::HealthMonitor (chrono::milliseconds interval, Callback callback)
  : _interval(interval),
    _callback(callback),
    _stop(false),
    _ticks(0) {
}

HealthMonitor::~HealthMonitor () {
  stop();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

void HealthMonitor::start () {
  lock_guard<mutex> lifecycle(_lifecycle);
  lock_guard<mutex> lock(_lock);

  if (_thread != nullptr) {
    return;
  }

  _stop = false;
  _thread.reset(new thread(&HealthMonitor::run, this));

  LOG(INFO)
  << "health monitor started, interval " << _interval.count() << "ms";
}

void HealthMonitor::stop () {
  lock_guard<mutex> lifecycle(_lifecycle);
  unique_ptr<thread> t;

  {
    lock_guard<mutex> lock(_lock);

    if (_thread == nullptr) {
      return;
    }

    _stop = true;
    t = move(_thread);
  }

  _wakeup.notify_all();
  t->join();

  LOG(INFO)
  << "health monitor stopped";
}

bool HealthMonitor::running () {
  lock_guard<mutex> lock(_lock);
  return _thread != nullptr;
}

void HealthMonitor::watch (const string& key) {
  lock_guard<mutex> lock(_lock);
  _watched.insert(key);
}

void HealthMonitor::unwatch (const string& key) {
  lock_guard<mutex> lock(_lock);
  _watched.erase(key);
}

bool HealthMonitor::watching (const string& key) {
  lock_guard<mutex> lock(_lock);
  return _watched.find(key) != _watched.end();
}

uint64_t HealthMonitor::ticks () {
  lock_guard<mutex> lock(_lock);
  return _ticks;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief timer loop
////////////////////////////////////////////////////////////////////////////////

void HealthMonitor::run () {
  unique_lock<mutex> lock(_lock);

  while (! _stop) {
    _wakeup.wait_for(lock, _interval, [this] () { return _stop; });

    if (_stop) {
      break;
    }

    vector<string> keys(_watched.begin(), _watched.end());
    lock.unlock();

    for (const auto& key : keys) {
      _callback(key);
    }

    lock.lock();
    ++_ticks;
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
