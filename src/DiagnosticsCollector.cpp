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

#include "DiagnosticsCollector.h"

#include "Conditions.h"
#include "utils.h"

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

static bool isHealthy (const ServerDiagnostic& server) {
  return server.state() == "Enabled" && server.health() == "Available";
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

DiagnosticsCollector::DiagnosticsCollector (StatusUpdater& updater,
                                            CircuitBreakerRegistry& breakers,
                                            OperatorMetrics& metrics,
                                            chrono::milliseconds queryTimeout)
  : _updater(updater),
    _breakers(breakers),
    _metrics(metrics),
    _queryTimeout(queryTimeout) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief collects the diagnostics and writes them with one status mutation
////////////////////////////////////////////////////////////////////////////////

Result DiagnosticsCollector::collect (const ClusterResource& cluster,
                                      ProtocolClient& client) {
  string key = clusterKey(cluster.ns(), cluster.name());
  auto breaker = _breakers.get(key);
  auto timeout = _queryTimeout;

  vector<ServerDiagnostic> servers;
  vector<DatabaseDiagnostic> databases;
  Result serversResult;
  Result databasesResult;

  // both queries pass on one admission, each result is recorded on its own
  if (breaker->allow()) {
    serversResult = client.listServers(timeout, servers);
    databasesResult = client.listDatabases(timeout, databases);

    breaker->record(serversResult);
    breaker->record(databasesResult);
  }
  else {
    serversResult = Result::error(ResultCode::CIRCUIT_OPEN,
                                  "circuit breaker is open, operation rejected");
    databasesResult = serversResult;
  }

  vector<string> errors;

  if (serversResult.isError()) {
    LOG(WARNING)
    << "cannot list servers of " << key << ": " << serversResult.toString();
    errors.push_back("servers: " + serversResult.errorMessage());
    servers.clear();
  }

  if (databasesResult.isError()) {
    LOG(WARNING)
    << "cannot list databases of " << key << ": " << databasesResult.toString();
    errors.push_back("databases: " + databasesResult.errorMessage());
    databases.clear();
  }

  for (const auto& server : servers) {
    _metrics.serverHealth->set(
      { cluster.name(), cluster.ns(), server.name(), server.address() },
      isHealthy(server) ? 1.0 : 0.0);
  }

  ConditionValue serversHealthy = evaluateServers(servers, serversResult);
  ConditionValue databasesHealthy = evaluateDatabases(databases, databasesResult);

  ClusterDiagnostics snapshot;

  for (const auto& server : servers) {
    *snapshot.add_servers() = server;
  }

  for (const auto& database : databases) {
    *snapshot.add_databases() = database;
  }

  snapshot.set_last_collected(toRFC3339(chrono::system_clock::now()));
  snapshot.set_collection_error(join(errors, "; "));

  return write(cluster, snapshot, serversHealthy, databasesHealthy);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief records a collection attempt which could not connect at all
////////////////////////////////////////////////////////////////////////////////

Result DiagnosticsCollector::recordUnavailable (const ClusterResource& cluster,
                                                const Result& error) {
  LOG(WARNING)
  << "no diagnostics for " << clusterKey(cluster.ns(), cluster.name())
  << ": " << error.toString();

  ClusterDiagnostics snapshot;
  snapshot.set_last_collected(toRFC3339(chrono::system_clock::now()));
  snapshot.set_collection_error("connection: " + error.errorMessage());

  return write(cluster, snapshot,
               evaluateServers(vector<ServerDiagnostic>(), error),
               evaluateDatabases(vector<DatabaseDiagnostic>(), error));
}

////////////////////////////////////////////////////////////////////////////////
/// @brief derives the ServersHealthy condition
////////////////////////////////////////////////////////////////////////////////

ConditionValue DiagnosticsCollector::evaluateServers (
  const vector<ServerDiagnostic>& servers,
  const Result& queryResult) {

  if (queryResult.isError()) {
    return ConditionValue{ STATUS_UNKNOWN, REASON_DIAGNOSTICS_UNAVAILABLE,
                           "SHOW SERVERS failed: " + queryResult.errorMessage() };
  }

  if (servers.empty()) {
    return ConditionValue{ STATUS_UNKNOWN, REASON_DIAGNOSTICS_UNAVAILABLE,
                           "SHOW SERVERS returned no servers" };
  }

  vector<string> degraded;

  for (const auto& server : servers) {
    if (! isHealthy(server)) {
      degraded.push_back(server.name() + " (state=" + server.state()
                         + ", health=" + server.health() + ")");
    }
  }

  if (degraded.empty()) {
    return ConditionValue{ STATUS_TRUE, REASON_ALL_SERVERS_HEALTHY,
                           "All " + to_string(servers.size())
                           + " servers are Enabled and Available" };
  }

  return ConditionValue{ STATUS_FALSE, REASON_SERVER_DEGRADED,
                         to_string(degraded.size()) + " of "
                         + to_string(servers.size())
                         + " servers are not healthy: " + join(degraded, ", ") };
}

////////////////////////////////////////////////////////////////////////////////
/// @brief derives the DatabasesHealthy condition, the system database is
/// not evaluated
////////////////////////////////////////////////////////////////////////////////

ConditionValue DiagnosticsCollector::evaluateDatabases (
  const vector<DatabaseDiagnostic>& databases,
  const Result& queryResult) {

  if (queryResult.isError()) {
    return ConditionValue{ STATUS_UNKNOWN, REASON_DIAGNOSTICS_UNAVAILABLE,
                           "SHOW DATABASES failed: " + queryResult.errorMessage() };
  }

  size_t userDatabases = 0;
  size_t requestedOnline = 0;
  vector<string> offline;

  for (const auto& database : databases) {
    if (database.name() == "system") {
      continue;
    }

    ++userDatabases;

    if (database.requested_status() != "online") {
      continue;
    }

    ++requestedOnline;

    if (database.status() != "online") {
      offline.push_back(database.name() + " (status=" + database.status()
                        + ", requested=" + database.requested_status() + ")");
    }
  }

  if (userDatabases == 0) {
    return ConditionValue{ STATUS_UNKNOWN, REASON_DIAGNOSTICS_UNAVAILABLE,
                           "SHOW DATABASES returned no user databases" };
  }

  if (offline.empty()) {
    return ConditionValue{ STATUS_TRUE, REASON_ALL_DATABASES_ONLINE,
                           "All " + to_string(requestedOnline)
                           + " databases requested online are online" };
  }

  return ConditionValue{ STATUS_FALSE, REASON_DATABASE_OFFLINE,
                         "Databases not online: " + join(offline, ", ") };
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief replaces the snapshot and sets both conditions in one mutation
////////////////////////////////////////////////////////////////////////////////

Result DiagnosticsCollector::write (const ClusterResource& cluster,
                                    const ClusterDiagnostics& snapshot,
                                    const ConditionValue& serversHealthy,
                                    const ConditionValue& databasesHealthy) {
  string key = clusterKey(cluster.ns(), cluster.name());
  string now = snapshot.last_collected();
  int64_t generation = cluster.generation();

  return _updater.updateStatus(key, [&] (ClusterStatus& status) {
    *status.mutable_diagnostics() = snapshot;

    setCondition(status, CONDITION_SERVERS_HEALTHY,
                 serversHealthy.status, serversHealthy.reason,
                 serversHealthy.message, generation, now);

    setCondition(status, CONDITION_DATABASES_HEALTHY,
                 databasesHealthy.status, databasesHealthy.reason,
                 databasesHealthy.message, generation, now);
  });
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
