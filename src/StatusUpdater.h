////////////////////////////////////////////////////////////////////////////////
/// @brief conflict retrying status writes
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

#ifndef NEO4J_STATUS_UPDATER_H
#define NEO4J_STATUS_UPDATER_H 1

#include "MetricsRegistry.h"
#include "Platform.h"
#include "Result.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <string>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                              class StatusUpdater
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief applies mutations to the status of a cluster resource
///
/// Each attempt reads the current resource, applies the mutation to a copy of
/// its status and writes it back. On a version conflict the whole cycle is
/// repeated from a fresh read, the stale write is never merged. The number
/// of attempts is bounded, exhausting them returns a transient error.
/// This is the only component which writes cluster status.
////////////////////////////////////////////////////////////////////////////////

  class StatusUpdater {
    StatusUpdater (const StatusUpdater&) = delete;
    StatusUpdater& operator= (const StatusUpdater&) = delete;

    public:

      typedef std::function<void (ClusterStatus&)> Mutation;

      typedef std::function<void (std::chrono::milliseconds)> Sleeper;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      StatusUpdater (Platform& platform,
                     OperatorMetrics& metrics,
                     int maxAttempts = 5,
                     std::chrono::milliseconds baseDelay
                       = std::chrono::milliseconds(50),
                     std::chrono::milliseconds maxDelay
                       = std::chrono::milliseconds(2000));

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief applies a mutation to the status of the cluster with the given key
///
/// A mutation which leaves the status unchanged does not write.
////////////////////////////////////////////////////////////////////////////////

      Result updateStatus (const std::string& key, const Mutation& mutate);

////////////////////////////////////////////////////////////////////////////////
/// @brief replaces the sleep between attempts
////////////////////////////////////////////////////////////////////////////////

      void setSleeper (Sleeper sleeper) {
        _sleeper = sleeper;
      }

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      std::chrono::milliseconds backoff (int attempt);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      Platform& _platform;

      OperatorMetrics& _metrics;

      const int _maxAttempts;

      const std::chrono::milliseconds _baseDelay;

      const std::chrono::milliseconds _maxDelay;

      Sleeper _sleeper;

      std::mutex _randomLock;

      std::mt19937 _random;
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
