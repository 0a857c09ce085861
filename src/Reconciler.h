////////////////////////////////////////////////////////////////////////////////
/// @brief reconciliation of one cluster resource
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

#ifndef NEO4J_RECONCILER_H
#define NEO4J_RECONCILER_H 1

#include "CircuitBreaker.h"
#include "ConvergenceEngine.h"
#include "DiagnosticsCollector.h"
#include "HealthMonitor.h"
#include "MetricsRegistry.h"
#include "Platform.h"
#include "ProtocolClient.h"
#include "ResourceBuilder.h"
#include "Result.h"
#include "SplitBrainDetector.h"
#include "StatusUpdater.h"
#include "TopologyValidator.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                           struct ReconcileOutcome
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief what the work queue should do with a key after a reconcile pass
////////////////////////////////////////////////////////////////////////////////

  struct ReconcileOutcome {
    ReconcileOutcome ()
      : requeueAfter(std::chrono::steady_clock::duration::zero()) {
    }

    std::string phase;

    // zero means no delayed requeue
    std::chrono::steady_clock::duration requeueAfter;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                                 class Reconciler
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief drives one cluster resource towards its declared state
///
/// A pass validates the topology, converges the child objects, derives the
/// phase and writes it through the status updater. While the cluster is
/// Ready it also runs the split-brain detector and the diagnostics collector.
/// Calls for the same key must be serialized by the caller.
////////////////////////////////////////////////////////////////////////////////

  class Reconciler {
    Reconciler (const Reconciler&) = delete;
    Reconciler& operator= (const Reconciler&) = delete;

    public:

      struct Options {
        Options ()
          : splitBrainInterval(std::chrono::seconds(60)),
            queryTimeout(std::chrono::seconds(10)),
            formingRequeue(std::chrono::seconds(10)),
            degradedRequeue(std::chrono::seconds(30)) {
        }

        std::chrono::steady_clock::duration splitBrainInterval;
        std::chrono::milliseconds queryTimeout;
        std::chrono::steady_clock::duration formingRequeue;
        std::chrono::steady_clock::duration degradedRequeue;
      };

      typedef std::function<std::chrono::steady_clock::time_point ()> Clock;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      Reconciler (Platform& platform,
                  const TopologyValidator& validator,
                  const ResourceBuilder& builder,
                  ConvergenceEngine& engine,
                  StatusUpdater& updater,
                  SplitBrainDetector& detector,
                  DiagnosticsCollector& collector,
                  ProtocolClientFactory& factory,
                  CircuitBreakerRegistry& breakers,
                  OperatorMetrics& metrics,
                  const Options& options = Options(),
                  Clock clock = &std::chrono::steady_clock::now);

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief sets the monitor which refreshes the diagnostics of Ready clusters
////////////////////////////////////////////////////////////////////////////////

      void setHealthMonitor (HealthMonitor* monitor) {
        _monitor = monitor;
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief runs one reconcile pass for "namespace/name"
///
/// An error result asks for a rate-limited retry, outcome.requeueAfter for
/// a delayed one.
////////////////////////////////////////////////////////////////////////////////

      Result reconcile (const std::string& key, ReconcileOutcome& outcome);

////////////////////////////////////////////////////////////////////////////////
/// @brief collects the diagnostics of a cluster if it is Ready
////////////////////////////////////////////////////////////////////////////////

      Result refreshDiagnostics (const std::string& key);

////////////////////////////////////////////////////////////////////////////////
/// @brief drops all local state kept for a cluster
////////////////////////////////////////////////////////////////////////////////

      void forget (const std::string& key);

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      Result doReconcile (const std::string& key, ReconcileOutcome& outcome);

      Result connect (const ClusterResource& cluster,
                      std::unique_ptr<ProtocolClient>& client);

      Result countHealthyServers (const ClusterResource& cluster,
                                  int& healthy);

      Result collectDiagnostics (const ClusterResource& cluster);

      bool splitBrainDue (const std::string& key);

      void recordReconcile (const std::string& key, const std::string& result);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      Platform& _platform;

      const TopologyValidator& _validator;

      const ResourceBuilder& _builder;

      ConvergenceEngine& _engine;

      StatusUpdater& _updater;

      SplitBrainDetector& _detector;

      DiagnosticsCollector& _collector;

      ProtocolClientFactory& _factory;

      CircuitBreakerRegistry& _breakers;

      OperatorMetrics& _metrics;

      const Options _options;

      Clock _clock;

      HealthMonitor* _monitor;

      std::mutex _lock;

////////////////////////////////////////////////////////////////////////////////
/// @brief time of the last split-brain check per cluster
////////////////////////////////////////////////////////////////////////////////

      std::map<std::string, std::chrono::steady_clock::time_point> _lastSplitBrainCheck;
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
