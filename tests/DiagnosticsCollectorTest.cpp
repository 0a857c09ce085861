////////////////////////////////////////////////////////////////////////////////
/// @brief tests for the live diagnostics
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
#include "FakePlatform.h"
#include "FakeProtocolClient.h"

#include <gtest/gtest.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                          fixture
// -----------------------------------------------------------------------------

namespace {
  class DiagnosticsCollectorTest : public ::testing::Test {
    protected:

      DiagnosticsCollectorTest ()
        : metrics(registry),
          updater(platform, metrics),
          breakers(2),
          collector(updater, breakers, metrics, chrono::seconds(1)) {
        cluster.set_name("graph");
        cluster.set_ns("prod");
        cluster.set_generation(3);
        platform.addCluster(cluster);

        healthy.servers.push_back(fakeServer("server-0", "graph-server-0.graph-headless:7687"));
        healthy.servers.push_back(fakeServer("server-1", "graph-server-1.graph-headless:7687"));
        healthy.servers.push_back(fakeServer("server-2", "graph-server-2.graph-headless:7687"));
        healthy.databases.push_back(fakeDatabase("system"));
        healthy.databases.push_back(fakeDatabase("neo4j"));
      }

      ClusterStatus status () {
        return platform.cluster("prod/graph").status();
      }

      const Condition& condition (const ClusterStatus& s, const string& type) {
        const Condition* c = findCondition(s, type);
        EXPECT_NE(nullptr, c);
        static const Condition none;
        return c == nullptr ? none : *c;
      }

      FakePlatform platform;
      MetricsRegistry registry;
      OperatorMetrics metrics;
      StatusUpdater updater;
      CircuitBreakerRegistry breakers;
      DiagnosticsCollector collector;
      ClusterResource cluster;
      FakeServer healthy;
  };
}

// -----------------------------------------------------------------------------
// --SECTION--                                                             tests
// -----------------------------------------------------------------------------

TEST_F(DiagnosticsCollectorTest, HealthyCluster) {
  FakeProtocolClient client("graph-client", healthy);
  ASSERT_FALSE(collector.collect(cluster, client).isError());

  ClusterStatus s = status();
  EXPECT_EQ(3, s.diagnostics().servers_size());
  EXPECT_EQ(2, s.diagnostics().databases_size());
  EXPECT_NE("", s.diagnostics().last_collected());
  EXPECT_EQ("", s.diagnostics().collection_error());

  const Condition& servers = condition(s, CONDITION_SERVERS_HEALTHY);
  EXPECT_EQ("True", servers.status());
  EXPECT_EQ("AllServersHealthy", servers.reason());
  EXPECT_EQ(3, servers.observed_generation());

  const Condition& databases = condition(s, CONDITION_DATABASES_HEALTHY);
  EXPECT_EQ("True", databases.status());
  EXPECT_EQ("AllDatabasesOnline", databases.reason());

  EXPECT_EQ(1, metrics.serverHealth->value(
                 {"graph", "prod", "server-1", "graph-server-1.graph-headless:7687"}));

  // snapshot and both conditions land in one write
  EXPECT_EQ(1, platform.statusWrites);
}

TEST_F(DiagnosticsCollectorTest, DegradedServer) {
  healthy.servers[2].set_health("Unavailable");

  FakeProtocolClient client("graph-client", healthy);
  ASSERT_FALSE(collector.collect(cluster, client).isError());

  const Condition& servers = condition(status(), CONDITION_SERVERS_HEALTHY);
  EXPECT_EQ("False", servers.status());
  EXPECT_EQ("ServerDegraded", servers.reason());
  EXPECT_NE(string::npos, servers.message().find("server-2"));

  EXPECT_EQ(0, metrics.serverHealth->value(
                 {"graph", "prod", "server-2", "graph-server-2.graph-headless:7687"}));
}

TEST_F(DiagnosticsCollectorTest, QueryFailureKeepsOtherResult) {
  healthy.serversError = Result::error(ResultCode::TIMEOUT, "timed out");

  FakeProtocolClient client("graph-client", healthy);
  ASSERT_FALSE(collector.collect(cluster, client).isError());

  ClusterStatus s = status();
  EXPECT_EQ(0, s.diagnostics().servers_size());
  EXPECT_EQ(2, s.diagnostics().databases_size());
  EXPECT_EQ("servers: timed out", s.diagnostics().collection_error());
  EXPECT_EQ("Unknown", condition(s, CONDITION_SERVERS_HEALTHY).status());
  EXPECT_EQ("True", condition(s, CONDITION_DATABASES_HEALTHY).status());
}

TEST_F(DiagnosticsCollectorTest, OpeningBreakerStillSendsDatabaseQuery) {
  auto breaker = breakers.get("prod/graph");
  breaker->recordFailure();
  ASSERT_EQ(CircuitBreaker::State::CLOSED, breaker->state());

  healthy.serversError = Result::error(ResultCode::TIMEOUT, "timed out");

  FakeProtocolClient client("graph-client", healthy);
  ASSERT_FALSE(collector.collect(cluster, client).isError());

  ClusterStatus s = status();
  EXPECT_EQ(2, s.diagnostics().databases_size());
  EXPECT_EQ("servers: timed out", s.diagnostics().collection_error());
  EXPECT_EQ("Unknown", condition(s, CONDITION_SERVERS_HEALTHY).status());
  EXPECT_EQ("True", condition(s, CONDITION_DATABASES_HEALTHY).status());
  EXPECT_EQ("AllDatabasesOnline", condition(s, CONDITION_DATABASES_HEALTHY).reason());
}

TEST_F(DiagnosticsCollectorTest, OpenBreakerSkipsQueries) {
  healthy.serversError = Result::error(ResultCode::UNAVAILABLE, "refused");
  healthy.databasesError = Result::error(ResultCode::UNAVAILABLE, "refused");

  FakeProtocolClient client("graph-client", healthy);
  ASSERT_FALSE(collector.collect(cluster, client).isError());

  EXPECT_EQ(CircuitBreaker::State::OPEN, breakers.get("prod/graph")->state());

  ASSERT_FALSE(collector.collect(cluster, client).isError());
  ClusterStatus s = status();
  EXPECT_NE(string::npos, s.diagnostics().collection_error().find("circuit breaker is open"));
  EXPECT_EQ("Unknown", condition(s, CONDITION_DATABASES_HEALTHY).status());
}

TEST_F(DiagnosticsCollectorTest, RecordUnavailable) {
  FakeProtocolClient client("graph-client", healthy);
  ASSERT_FALSE(collector.collect(cluster, client).isError());

  Result error = Result::error(ResultCode::UNAVAILABLE, "cannot reach graph-client");
  ASSERT_FALSE(collector.recordUnavailable(cluster, error).isError());

  ClusterStatus s = status();
  EXPECT_EQ(0, s.diagnostics().servers_size());
  EXPECT_EQ("connection: cannot reach graph-client", s.diagnostics().collection_error());
  EXPECT_EQ("Unknown", condition(s, CONDITION_SERVERS_HEALTHY).status());
  EXPECT_EQ("DiagnosticsUnavailable", condition(s, CONDITION_DATABASES_HEALTHY).reason());
}

TEST(DiagnosticsEvaluation, Servers) {
  vector<ServerDiagnostic> servers;

  ConditionValue none = DiagnosticsCollector::evaluateServers(servers, Result::noError());
  EXPECT_EQ("Unknown", none.status);

  servers.push_back(fakeServer("a", "a:7687"));
  servers.push_back(fakeServer("b", "b:7687", "Cordoned"));

  ConditionValue degraded = DiagnosticsCollector::evaluateServers(servers, Result::noError());
  EXPECT_EQ("False", degraded.status);
  EXPECT_EQ("1 of 2 servers are not healthy: b (state=Cordoned, health=Available)",
            degraded.message);
}

TEST(DiagnosticsEvaluation, Databases) {
  vector<DatabaseDiagnostic> databases;
  databases.push_back(fakeDatabase("system", "offline"));

  EXPECT_EQ("Unknown",
            DiagnosticsCollector::evaluateDatabases(databases, Result::noError()).status);

  databases.push_back(fakeDatabase("neo4j"));
  databases.push_back(fakeDatabase("archive", "offline", "offline"));

  ConditionValue online = DiagnosticsCollector::evaluateDatabases(databases, Result::noError());
  EXPECT_EQ("True", online.status);
  EXPECT_EQ("All 1 databases requested online are online", online.message);

  databases.push_back(fakeDatabase("sales", "starting"));

  ConditionValue offline = DiagnosticsCollector::evaluateDatabases(databases, Result::noError());
  EXPECT_EQ("False", offline.status);
  EXPECT_EQ("DatabaseOffline", offline.reason);
  EXPECT_EQ("Databases not online: sales (status=starting, requested=online)",
            offline.message);

  ConditionValue failed = DiagnosticsCollector::evaluateDatabases(
    databases, Result::error(ResultCode::QUERY, "boom"));
  EXPECT_EQ("Unknown", failed.status);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
