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

#ifndef NEO4J_HEALTH_MONITOR_H
#define NEO4J_HEALTH_MONITOR_H 1

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                              class HealthMonitor
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief calls a function for every watched cluster in a fixed interval
///
/// The timer thread is started by start and joined by stop, both can be
/// called repeatedly. Stopping wakes the thread immediately.
////////////////////////////////////////////////////////////////////////////////

  class HealthMonitor {
    HealthMonitor (const HealthMonitor&) = delete;
    HealthMonitor& operator= (const HealthMonitor&) = delete;

    public:

      typedef std::function<void (const std::string& key)> Callback;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      HealthMonitor (std::chrono::milliseconds interval, Callback callback);

      ~HealthMonitor ();

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

      void start ();

      void stop ();

      bool running ();

      void watch (const std::string& key);

      void unwatch (const std::string& key);

      bool watching (const std::string& key);

////////////////////////////////////////////////////////////////////////////////
/// @brief number of completed ticks since construction
////////////////////////////////////////////////////////////////////////////////

      uint64_t ticks ();

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      void run ();

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      const std::chrono::milliseconds _interval;

      Callback _callback;

////////////////////////////////////////////////////////////////////////////////
/// @brief serializes start and stop
////////////////////////////////////////////////////////////////////////////////

      std::mutex _lifecycle;

////////////////////////////////////////////////////////////////////////////////
/// @brief protects all variables below
////////////////////////////////////////////////////////////////////////////////

      std::mutex _lock;

      std::condition_variable _wakeup;

      bool _stop;

      std::unique_ptr<std::thread> _thread;

      std::set<std::string> _watched;

      uint64_t _ticks;
  };
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
