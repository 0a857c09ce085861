////////////////////////////////////////////////////////////////////////////////
/// @brief live diagnostics of a cluster
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

#ifndef NEO4J_DIAGNOSTICS_COLLECTOR_H
#define NEO4J_DIAGNOSTICS_COLLECTOR_H 1

#include "CircuitBreaker.h"
#include "MetricsRegistry.h"
#include "ProtocolClient.h"
#include "StatusUpdater.h"
#include "neo4j.pb.h"

#include <chrono>
#include <string>
#include <vector>

namespace neo4j {

////////////////////////////////////////////////////////////////////////////////
/// @brief status, reason and message of a derived condition
////////////////////////////////////////////////////////////////////////////////

  struct ConditionValue {
    std::string status;
    std::string reason;
    std::string message;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                       class DiagnosticsCollector
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief queries servers and databases of a cluster and derives the
/// ServersHealthy and DatabasesHealthy conditions
///
/// Query failures never abort the caller, they show up in collectionError
/// and as Unknown conditions.
////////////////////////////////////////////////////////////////////////////////

  class DiagnosticsCollector {
    DiagnosticsCollector (const DiagnosticsCollector&) = delete;
    DiagnosticsCollector& operator= (const DiagnosticsCollector&) = delete;

    public:

      DiagnosticsCollector (StatusUpdater& updater,
                            CircuitBreakerRegistry& breakers,
                            OperatorMetrics& metrics,
                            std::chrono::milliseconds queryTimeout);

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief collects the diagnostics and writes them with one status mutation
////////////////////////////////////////////////////////////////////////////////

      Result collect (const ClusterResource& cluster, ProtocolClient& client);

////////////////////////////////////////////////////////////////////////////////
/// @brief records a collection attempt which could not connect at all
////////////////////////////////////////////////////////////////////////////////

      Result recordUnavailable (const ClusterResource& cluster,
                                const Result& error);

      static ConditionValue evaluateServers (
        const std::vector<ServerDiagnostic>& servers,
        const Result& queryResult);

      static ConditionValue evaluateDatabases (
        const std::vector<DatabaseDiagnostic>& databases,
        const Result& queryResult);

    private:

      Result write (const ClusterResource& cluster,
                    const ClusterDiagnostics& snapshot,
                    const ConditionValue& serversHealthy,
                    const ConditionValue& databasesHealthy);

    private:

      StatusUpdater& _updater;

      CircuitBreakerRegistry& _breakers;

      OperatorMetrics& _metrics;

      const std::chrono::milliseconds _queryTimeout;
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
