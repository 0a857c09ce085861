////////////////////////////////////////////////////////////////////////////////
/// @brief tests for the reconciliation of one cluster resource
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

#include "Reconciler.h"

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
  const char* Key = "prod/graph";
  const char* ClientHost = "graph-client.prod.svc.cluster.local";

  Reconciler::Options options () {
    Reconciler::Options o;
    o.splitBrainInterval = chrono::seconds(60);
    o.queryTimeout = chrono::seconds(1);
    o.formingRequeue = chrono::seconds(10);
    o.degradedRequeue = chrono::seconds(30);
    return o;
  }

  class ReconcilerTest : public ::testing::Test {
    protected:

      ReconcilerTest ()
        : now(chrono::steady_clock::time_point() + chrono::hours(1)),
          metrics(registry),
          validator(20),
          engine(platform, chrono::seconds(30), [this] () { return now; }),
          updater(platform, metrics),
          breakers(3),
          detector(factory, platform, metrics, chrono::seconds(1)),
          collector(updater, breakers, metrics, chrono::seconds(1)),
          monitor(chrono::hours(1), [] (const string&) {}),
          reconciler(platform, validator, builder, engine, updater, detector,
                     collector, factory, breakers, metrics, options(),
                     [this] () { return now; }) {
        updater.setSleeper([] (chrono::milliseconds) {});
        reconciler.setHealthMonitor(&monitor);

        cluster.set_name("graph");
        cluster.set_ns("prod");
        cluster.set_generation(1);
        cluster.mutable_spec()->mutable_topology()->set_primaries(3);
        cluster.mutable_spec()->mutable_image()->set_repo("neo4j");
        cluster.mutable_spec()->mutable_image()->set_tag("5.26-enterprise");
        platform.addCluster(cluster);
      }

      void updateSpec (const function<void (ClusterSpec&)>& change) {
        ClusterResource c = platform.cluster(Key);
        change(*c.mutable_spec());
        c.set_generation(c.generation() + 1);
        platform.addCluster(c);
        cluster = c;
      }

      vector<string> names () {
        return { "graph-server-0", "graph-server-1", "graph-server-2" };
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief all pods running, every member sees every other one
////////////////////////////////////////////////////////////////////////////////

      void formCluster () {
        vector<Member> members;
        FakeServer view;

        for (const auto& name : names()) {
          Member m;
          m.set_name(name);
          m.set_host(memberHost(cluster, name));
          m.set_running(true);
          members.push_back(m);

          view.servers.push_back(fakeServer(name, m.host() + ":7687"));
        }

        view.databases.push_back(fakeDatabase("system"));
        view.databases.push_back(fakeDatabase("neo4j"));

        platform.setMembers(cluster, members);
        factory.script(ClientHost, view);

        for (const auto& m : members) {
          factory.script(m.host(), view);
        }
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief graph-server-2 is cut off, it sees only itself and the client
/// service reports it Unavailable
////////////////////////////////////////////////////////////////////////////////

      void isolateLastServer () {
        FakeServer view;

        for (const auto& name : names()) {
          string address = memberHost(cluster, name) + ":7687";

          if (name == "graph-server-2") {
            view.servers.push_back(fakeServer(name, address, "Enabled", "Unavailable"));
          }
          else {
            view.servers.push_back(fakeServer(name, address));
          }
        }

        view.databases.push_back(fakeDatabase("system"));
        view.databases.push_back(fakeDatabase("neo4j"));

        factory.script(ClientHost, view);
        factory.script(memberHost(cluster, "graph-server-0"), view);
        factory.script(memberHost(cluster, "graph-server-1"), view);

        FakeServer alone;
        alone.servers.push_back(fakeServer("graph-server-2",
                                           memberHost(cluster, "graph-server-2") + ":7687"));
        factory.script(memberHost(cluster, "graph-server-2"), alone);
      }

      ClusterStatus status () {
        return platform.cluster(Key).status();
      }

      string conditionStatus (const string& type) {
        ClusterStatus s = status();
        const Condition* c = findCondition(s, type);
        return c == nullptr ? "" : c->status();
      }

      string conditionReason (const string& type) {
        ClusterStatus s = status();
        const Condition* c = findCondition(s, type);
        return c == nullptr ? "" : c->reason();
      }

      double reconciles (const string& result) {
        return metrics.reconcileTotal->value({"graph", "prod", result});
      }

      chrono::steady_clock::time_point now;
      FakePlatform platform;
      FakeProtocolClientFactory factory;
      MetricsRegistry registry;
      OperatorMetrics metrics;
      TopologyValidator validator;
      DefaultResourceBuilder builder;
      ConvergenceEngine engine;
      StatusUpdater updater;
      CircuitBreakerRegistry breakers;
      SplitBrainDetector detector;
      DiagnosticsCollector collector;
      HealthMonitor monitor;
      Reconciler reconciler;
      ClusterResource cluster;
  };
}

// -----------------------------------------------------------------------------
// --SECTION--                                                             tests
// -----------------------------------------------------------------------------

TEST_F(ReconcilerTest, NewClusterIsForming) {
  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Forming", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration(chrono::seconds(10)), outcome.requeueAfter);
  EXPECT_EQ(4, platform.creates);

  ClusterStatus s = status();
  EXPECT_EQ("Forming", s.phase());
  EXPECT_EQ("0 of 3 servers running", s.message());
  EXPECT_EQ(1, s.observed_generation());
  EXPECT_EQ(3, s.replicas().primaries());
  EXPECT_EQ(0, s.replicas().ready());
  EXPECT_EQ("bolt://graph-client.prod.svc.cluster.local:7687", s.endpoints().bolt());
  EXPECT_EQ("http://graph-client.prod.svc.cluster.local:7474", s.endpoints().http());
  EXPECT_EQ("graph-headless.prod.svc.cluster.local", s.endpoints().headless());

  EXPECT_EQ("True", conditionStatus(CONDITION_TOPOLOGY_VALID));
  EXPECT_EQ("False", conditionStatus(CONDITION_READY));
  EXPECT_EQ("ClusterForming", conditionReason(CONDITION_READY));
  EXPECT_EQ("", conditionStatus(CONDITION_MEMBERSHIP_CONSISTENT));

  EXPECT_FALSE(monitor.watching(Key));
  EXPECT_EQ(1, reconciles("success"));
}

TEST_F(ReconcilerTest, FormedClusterIsReady) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Ready", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration(chrono::seconds(60)), outcome.requeueAfter);

  ClusterStatus s = status();
  EXPECT_EQ("Cluster is ready", s.message());
  EXPECT_EQ(3, s.replicas().ready());
  EXPECT_EQ("True", conditionStatus(CONDITION_READY));
  EXPECT_EQ("ClusterReady", conditionReason(CONDITION_READY));
  EXPECT_EQ("True", conditionStatus(CONDITION_MEMBERSHIP_CONSISTENT));
  EXPECT_EQ("True", conditionStatus(CONDITION_SERVERS_HEALTHY));
  EXPECT_EQ("True", conditionStatus(CONDITION_DATABASES_HEALTHY));
  EXPECT_EQ(3, s.diagnostics().servers_size());

  EXPECT_TRUE(monitor.watching(Key));

  vector<FakeEvent> events = platform.events();
  ASSERT_EQ(1u, events.size());
  EXPECT_EQ("ClusterReady", events[0].reason);
  EXPECT_EQ("Normal", events[0].type);
  EXPECT_EQ(Key, events[0].key);
}

TEST_F(ReconcilerTest, ReadyClusterIsStable) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  int writes = platform.statusWrites;
  int created = factory.created;

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Ready", outcome.phase);
  EXPECT_EQ(0, platform.updates);

  // the split-brain check is not due yet, only the client service is asked
  EXPECT_EQ(created + 2, factory.created);

  // only the collection time of the diagnostics changes
  EXPECT_GE(writes + 1, platform.statusWrites);

  EXPECT_EQ(1u, platform.countEvents("ClusterReady"));
}

TEST_F(ReconcilerTest, SplitBrainCheckEveryInterval) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  // member 2 loses the others, the client service has not noticed yet
  FakeServer alone;
  alone.servers.push_back(fakeServer("graph-server-2",
                                     memberHost(cluster, "graph-server-2") + ":7687"));
  factory.script(memberHost(cluster, "graph-server-2"), alone);

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ("Ready", outcome.phase);
  EXPECT_TRUE(platform.deletedPods().empty());

  now += chrono::seconds(60);
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Degraded", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration(chrono::seconds(30)), outcome.requeueAfter);
  EXPECT_EQ("False", conditionStatus(CONDITION_MEMBERSHIP_CONSISTENT));
  EXPECT_EQ("SplitBrainDetected", conditionReason(CONDITION_READY));
  EXPECT_EQ("False", conditionStatus(CONDITION_READY));
  EXPECT_EQ(1, metrics.splitBrainDetected->value({"graph", "prod"}));
  EXPECT_FALSE(monitor.watching(Key));

  vector<string> deleted = platform.deletedPods();
  ASSERT_EQ(1u, deleted.size());
  EXPECT_EQ("prod/graph-server-2", deleted[0]);
}

TEST_F(ReconcilerTest, PartitionOfFormingClusterIsRepaired) {
  formCluster();
  isolateLastServer();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Degraded", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration(chrono::seconds(30)), outcome.requeueAfter);
  EXPECT_EQ("False", conditionStatus(CONDITION_MEMBERSHIP_CONSISTENT));
  EXPECT_EQ("SplitBrainDetected", conditionReason(CONDITION_MEMBERSHIP_CONSISTENT));
  EXPECT_EQ(2, status().replicas().ready());

  vector<string> deleted = platform.deletedPods();
  ASSERT_EQ(1u, deleted.size());
  EXPECT_EQ("prod/graph-server-2", deleted[0]);

  EXPECT_EQ(1u, platform.countEvents("SplitBrainDetected"));
  EXPECT_EQ(1u, platform.countEvents("SplitBrainRepaired"));
  EXPECT_EQ(0u, platform.countEvents("ClusterReady"));
}

TEST_F(ReconcilerTest, PartitionOfReadyClusterIsRepairedAtOnce) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  ASSERT_EQ("Ready", outcome.phase);

  // the periodic check is not due, the shortfall alone triggers it
  isolateLastServer();

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Degraded", outcome.phase);
  EXPECT_EQ("False", conditionStatus(CONDITION_READY));
  EXPECT_EQ(1u, platform.deletedPods().size());
  EXPECT_FALSE(monitor.watching(Key));
}

TEST_F(ReconcilerTest, FailedRepairIsRecorded) {
  formCluster();
  isolateLastServer();
  platform.failDeletes(Result::error(ResultCode::AUTH, "pods is forbidden"));

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Degraded", outcome.phase);
  EXPECT_TRUE(platform.deletedPods().empty());
  EXPECT_EQ(1u, platform.countEvents("SplitBrainDetected"));
  EXPECT_EQ(1u, platform.countEvents("SplitBrainRepairFailed"));
}

TEST_F(ReconcilerTest, DegradedClusterIsCheckedAgain) {
  formCluster();
  isolateLastServer();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ("Degraded", outcome.phase);

  // the restarted member rejoined
  formCluster();

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ("Ready", outcome.phase);
  EXPECT_EQ("True", conditionStatus(CONDITION_MEMBERSHIP_CONSISTENT));
}

TEST_F(ReconcilerTest, InvalidTopologyFails) {
  updateSpec([] (ClusterSpec& spec) {
    spec.mutable_topology()->set_primaries(0);
    spec.mutable_topology()->set_secondaries(-1);
  });

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Failed", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration::zero(), outcome.requeueAfter);
  EXPECT_EQ(0, platform.creates);

  ClusterStatus s = status();
  EXPECT_EQ("Failed", s.phase());
  EXPECT_NE(string::npos, s.message().find("; "));
  EXPECT_EQ(2, s.observed_generation());
  EXPECT_EQ("False", conditionStatus(CONDITION_TOPOLOGY_VALID));
  EXPECT_EQ("InvalidTopology", conditionReason(CONDITION_READY));
  EXPECT_EQ(1, reconciles("invalid"));

  vector<FakeEvent> events = platform.events();
  ASSERT_EQ(1u, events.size());
  EXPECT_EQ("ValidationFailed", events[0].reason);
  EXPECT_EQ("Warning", events[0].type);
  EXPECT_EQ(s.message(), events[0].message);

  // a resync of the unchanged resource does not repeat the event
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ(1u, platform.countEvents("ValidationFailed"));
}

TEST_F(ReconcilerTest, WarningsDoNotBlock) {
  updateSpec([] (ClusterSpec& spec) {
    spec.mutable_topology()->set_primaries(2);
  });

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Forming", outcome.phase);
  EXPECT_EQ("True", conditionStatus(CONDITION_TOPOLOGY_VALID));

  ClusterStatus s = status();
  const Condition* topology = findCondition(s, CONDITION_TOPOLOGY_VALID);
  ASSERT_NE(nullptr, topology);
  EXPECT_NE(string::npos, topology->message().find("Even number of primary nodes"));
  EXPECT_EQ(1u, platform.countEvents("TopologyWarning"));

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ(1u, platform.countEvents("TopologyWarning"));
}

TEST_F(ReconcilerTest, ConvergenceFailure) {
  platform.failChildWrites(Result::error(ResultCode::UNAVAILABLE, "api server down"));

  ReconcileOutcome outcome;
  Result res = reconciler.reconcile(Key, outcome);

  EXPECT_EQ(ResultCode::UNAVAILABLE, res.code());
  EXPECT_EQ("Failed", status().phase());
  EXPECT_EQ("ReconciliationFailed", conditionReason(CONDITION_READY));
  EXPECT_EQ(1, reconciles("error"));
}

TEST_F(ReconcilerTest, UnreachableClusterKeepsForming) {
  formCluster();
  factory.remove(ClientHost);

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Forming", outcome.phase);
  EXPECT_NE(string::npos, status().message().find("Waiting for the cluster to answer"));
  EXPECT_EQ(3, status().replicas().ready());
}

TEST_F(ReconcilerTest, UnhealthyServersKeepForming) {
  formCluster();

  FakeServer view;
  view.servers.push_back(fakeServer("graph-server-0", "a:7687"));
  view.servers.push_back(fakeServer("graph-server-1", "b:7687"));
  view.servers.push_back(fakeServer("graph-server-2", "c:7687", "Enabled", "Unavailable"));
  factory.script(ClientHost, view);

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Forming", outcome.phase);
  EXPECT_EQ("2 of 3 servers are Enabled and Available", status().message());
  EXPECT_EQ(2, status().replicas().ready());

  // the members agree, so the shortfall is not a partition
  EXPECT_EQ("True", conditionStatus(CONDITION_MEMBERSHIP_CONSISTENT));
  EXPECT_TRUE(platform.deletedPods().empty());
}

TEST_F(ReconcilerTest, ImageChangeIsUpgrade) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  ASSERT_EQ("Ready", outcome.phase);

  updateSpec([] (ClusterSpec& spec) {
    spec.mutable_image()->set_tag("5.27-enterprise");
  });

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Upgrading", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration(chrono::seconds(10)), outcome.requeueAfter);
  EXPECT_EQ("Upgrading from neo4j:5.26-enterprise to neo4j:5.27-enterprise",
            status().message());
  EXPECT_EQ("UpgradeInProgress", conditionReason(CONDITION_READY));
  EXPECT_EQ("False", conditionStatus(CONDITION_READY));

  ChildObject sts;
  ASSERT_TRUE(platform.child(KIND_STATEFUL_SET, "prod", "graph-server", sts));
  EXPECT_EQ("neo4j:5.27-enterprise", sts.annotations().at(ANNOTATION_IMAGE));

  // the rollout restarts a server
  vector<Member> members;
  ASSERT_FALSE(platform.listMembers(cluster, members).isError());
  members[1].set_running(false);
  platform.setMembers(cluster, members);

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ("Upgrading", outcome.phase);

  members[1].set_running(true);
  platform.setMembers(cluster, members);

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ("Ready", outcome.phase);
}

TEST_F(ReconcilerTest, DebouncedConfigShortensRequeue) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  updateSpec([] (ClusterSpec& spec) {
    spec.mutable_query_monitoring()->set_enabled(true);
  });

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ("Ready", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration(chrono::seconds(30)), outcome.requeueAfter);
  EXPECT_EQ(1u, engine.pendingChanges());
}

TEST_F(ReconcilerTest, ScalingFromOneServerRestartsIt) {
  updateSpec([] (ClusterSpec& spec) {
    spec.mutable_topology()->set_primaries(1);
  });

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  updateSpec([] (ClusterSpec& spec) {
    spec.mutable_topology()->set_primaries(3);
  });

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ(0u, engine.pendingChanges());

  ChildObject config;
  ASSERT_TRUE(platform.child(KIND_CONFIG_MAP, "prod", "graph-config", config));
  EXPECT_NE(string::npos,
            config.data().at("neo4j.conf")
              .find("dbms.cluster.minimum_initial_system_primaries_count=3\n"));

  ChildObject sts;
  ASSERT_TRUE(platform.child(KIND_STATEFUL_SET, "prod", "graph-server", sts));
  EXPECT_NE(string::npos, sts.spec_json().find(ANNOTATION_RESTARTED_AT));
}

TEST_F(ReconcilerTest, StatusConflictsAreRetried) {
  platform.injectStatusConflicts(2);

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());

  EXPECT_EQ("Forming", status().phase());
  EXPECT_EQ(2, metrics.resourceVersionConflicts->value({"graph", "prod"}));
}

TEST_F(ReconcilerTest, DeletedClusterIsForgotten) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_TRUE(monitor.watching(Key));
  EXPECT_EQ(1u, breakers.size());

  platform.removeCluster(Key);

  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  EXPECT_EQ("", outcome.phase);
  EXPECT_EQ(chrono::steady_clock::duration::zero(), outcome.requeueAfter);
  EXPECT_FALSE(monitor.watching(Key));
  EXPECT_EQ(0u, breakers.size());
}

TEST_F(ReconcilerTest, RefreshDiagnosticsOnlyWhenReady) {
  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  int created = factory.created;

  ASSERT_FALSE(reconciler.refreshDiagnostics(Key).isError());
  EXPECT_EQ(created, factory.created);

  formCluster();
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  ASSERT_EQ("Ready", outcome.phase);

  FakeServer view;
  view.servers.push_back(fakeServer("graph-server-0", "a:7687", "Enabled", "Unavailable"));
  view.databases.push_back(fakeDatabase("neo4j"));
  factory.script(ClientHost, view);

  ASSERT_FALSE(reconciler.refreshDiagnostics(Key).isError());
  EXPECT_EQ("False", conditionStatus(CONDITION_SERVERS_HEALTHY));

  platform.removeCluster(Key);
  EXPECT_EQ(ResultCode::NOT_FOUND, reconciler.refreshDiagnostics(Key).code());
  EXPECT_FALSE(monitor.watching(Key));
  EXPECT_EQ(0u, breakers.size());
}

TEST_F(ReconcilerTest, ClusterDeletedDuringRefreshLeavesNoBreaker) {
  formCluster();

  ReconcileOutcome outcome;
  ASSERT_FALSE(reconciler.reconcile(Key, outcome).isError());
  ASSERT_EQ("Ready", outcome.phase);

  // the deletion is handled between the read and the connect
  factory.onCreate = [this] (const string&) {
    platform.removeCluster(Key);
    reconciler.forget(Key);
  };

  ASSERT_FALSE(reconciler.refreshDiagnostics(Key).isError());

  EXPECT_EQ(0u, breakers.size());
  EXPECT_FALSE(monitor.watching(Key));
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
