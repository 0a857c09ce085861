////////////////////////////////////////////////////////////////////////////////
/// @brief controller for the cluster resources
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

#ifndef NEO4J_CLUSTER_CONTROLLER_H
#define NEO4J_CLUSTER_CONTROLLER_H 1

#include "HealthMonitor.h"
#include "Platform.h"
#include "Reconciler.h"
#include "WorkQueue.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                               struct ClusterState
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief what the controller knows about a cluster
////////////////////////////////////////////////////////////////////////////////

  struct ClusterState {
    ClusterState ()
      : reconciles(0) {
    }

    std::string phase;
    std::string lastResult;
    std::string lastReconciled;
    uint64_t reconciles;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                          class ClusterController
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief feeds cluster keys into a work queue consumed by a worker pool
///
/// The poll thread lists the cluster resources and enqueues the keys whose
/// generation changed or which disappeared, and every key once per resync
/// interval. The health monitor refreshes the diagnostics of Ready clusters.
////////////////////////////////////////////////////////////////////////////////

  class ClusterController {
    ClusterController (const ClusterController&) = delete;
    ClusterController& operator= (const ClusterController&) = delete;

    public:

      struct Options {
        Options ()
          : workers(4),
            pollInterval(std::chrono::seconds(5)),
            resyncInterval(std::chrono::seconds(300)),
            healthInterval(std::chrono::seconds(30)) {
        }

        int workers;
        std::chrono::milliseconds pollInterval;
        std::chrono::milliseconds resyncInterval;
        std::chrono::milliseconds healthInterval;
      };

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      ClusterController (Platform& platform,
                         Reconciler& reconciler,
                         const Options& options = Options());

      ~ClusterController ();

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief starts the workers, the poll thread and the health monitor
////////////////////////////////////////////////////////////////////////////////

      void start ();

////////////////////////////////////////////////////////////////////////////////
/// @brief stops and joins all threads, may be called repeatedly
////////////////////////////////////////////////////////////////////////////////

      void stop ();

      bool running ();

////////////////////////////////////////////////////////////////////////////////
/// @brief lists the clusters once and enqueues the changed keys
////////////////////////////////////////////////////////////////////////////////

      Result poll (bool resync);

////////////////////////////////////////////////////////////////////////////////
/// @brief enqueues a key
////////////////////////////////////////////////////////////////////////////////

      void enqueue (const std::string& key);

////////////////////////////////////////////////////////////////////////////////
/// @brief takes one key from the queue and reconciles it
///
/// Returns false once the queue has been shut down.
////////////////////////////////////////////////////////////////////////////////

      bool processNext ();

////////////////////////////////////////////////////////////////////////////////
/// @brief copy of the per-cluster state
////////////////////////////////////////////////////////////////////////////////

      std::map<std::string, ClusterState> snapshot ();

      WorkQueue& queue () {
        return *_queue;
      }

      HealthMonitor& monitor () {
        return _monitor;
      }

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      void worker ();

      void pollLoop ();

      void healthTick (const std::string& key);

      void record (const std::string& key,
                   const ReconcileOutcome& outcome,
                   const Result& res);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      Platform& _platform;

      Reconciler& _reconciler;

      const Options _options;

      HealthMonitor _monitor;

      std::unique_ptr<WorkQueue> _queue;

////////////////////////////////////////////////////////////////////////////////
/// @brief serializes start and stop
////////////////////////////////////////////////////////////////////////////////

      std::mutex _lifecycle;

      std::mutex _lock;

      std::condition_variable _wakeup;

      bool _stop;

      bool _running;

      std::vector<std::unique_ptr<std::thread>> _workers;

      std::unique_ptr<std::thread> _poller;

////////////////////////////////////////////////////////////////////////////////
/// @brief generation and uid seen by the last poll, per key
////////////////////////////////////////////////////////////////////////////////

      std::map<std::string, std::string> _known;

      std::map<std::string, ClusterState> _states;
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
