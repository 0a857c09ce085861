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

#include "Reconciler.h"

#include "Conditions.h"
#include "utils.h"

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

static const ChildObject* findStatefulSet (const ClusterResource& cluster,
                                           const vector<ChildObject>& live) {
  string name = statefulSetName(cluster);

  for (const auto& child : live) {
    if (child.kind() == KIND_STATEFUL_SET && child.name() == name) {
      return &child;
    }
  }

  return nullptr;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief primaries recorded on the live StatefulSet by the last apply
////////////////////////////////////////////////////////////////////////////////

static Option<int32_t> previousPrimaries (const ChildObject* statefulSet) {
  if (statefulSet == nullptr) {
    return None();
  }

  auto it = statefulSet->annotations().find(ANNOTATION_PRIMARIES);

  if (it == statefulSet->annotations().end()) {
    return None();
  }

  try {
    return static_cast<int32_t>(stoi(it->second));
  }
  catch (const logic_error&) {
    LOG(WARNING)
    << "ignoring malformed annotation " << ANNOTATION_PRIMARIES
    << "='" << it->second << "' on " << statefulSet->name();
    return None();
  }
}

static string liveImage (const ChildObject* statefulSet) {
  if (statefulSet == nullptr) {
    return "";
  }

  auto it = statefulSet->annotations().find(ANNOTATION_IMAGE);

  if (it == statefulSet->annotations().end()) {
    return "";
  }

  return it->second;
}

static bool isHealthy (const ServerDiagnostic& server) {
  return server.state() == "Enabled" && server.health() == "Available";
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reason of the Ready condition for a phase
////////////////////////////////////////////////////////////////////////////////

static string readyReason (const string& phase) {
  if (phase == PHASE_READY) {
    return REASON_CLUSTER_READY;
  }

  if (phase == PHASE_UPGRADING) {
    return REASON_UPGRADE_IN_PROGRESS;
  }

  if (phase == PHASE_DEGRADED) {
    return REASON_SPLIT_BRAIN_DETECTED;
  }

  if (phase == PHASE_FAILED) {
    return REASON_RECONCILIATION_FAILED;
  }

  if (phase == PHASE_FORMING) {
    return REASON_CLUSTER_FORMING;
  }

  return REASON_PENDING;
}

static string readyStatus (const string& phase) {
  if (phase == PHASE_FORMING || phase == PHASE_UPGRADING) {
    return STATUS_FALSE;
  }

  return phaseToConditionStatus(phase);
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

Reconciler::Reconciler (Platform& platform,
                        const TopologyValidator& validator,
                        const ResourceBuilder& builder,
                        ConvergenceEngine& engine,
                        StatusUpdater& updater,
                        SplitBrainDetector& detector,
                        DiagnosticsCollector& collector,
                        ProtocolClientFactory& factory,
                        CircuitBreakerRegistry& breakers,
                        OperatorMetrics& metrics,
                        const Options& options,
                        Clock clock)
  : _platform(platform),
    _validator(validator),
    _builder(builder),
    _engine(engine),
    _updater(updater),
    _detector(detector),
    _collector(collector),
    _factory(factory),
    _breakers(breakers),
    _metrics(metrics),
    _options(options),
    _clock(clock),
    _monitor(nullptr) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief runs one reconcile pass for "namespace/name"
////////////////////////////////////////////////////////////////////////////////

Result Reconciler::reconcile (const string& key, ReconcileOutcome& outcome) {
  LOG(INFO) << "reconciling " << key;

  outcome = ReconcileOutcome();
  Result res = doReconcile(key, outcome);

  if (res.isError()) {
    LOG(WARNING)
    << "reconcile of " << key << " failed: " << res.toString();
  }
  else {
    LOG(INFO)
    << "reconciled " << key
    << (outcome.phase.empty() ? string("") : ", phase " + outcome.phase);
  }

  return res;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief collects the diagnostics of a cluster if it is Ready
////////////////////////////////////////////////////////////////////////////////

Result Reconciler::refreshDiagnostics (const string& key) {
  ClusterResource cluster;
  Result res = _platform.getCluster(key, cluster);

  if (res.isError()) {
    if (res.code() == ResultCode::NOT_FOUND) {
      forget(key);
    }

    return res;
  }

  if (cluster.status().phase() != PHASE_READY) {
    VLOG(1) << "skipping diagnostics of " << key
            << " in phase " << cluster.status().phase();
    return Result::noError();
  }

  res = collectDiagnostics(cluster);

  // the cluster can vanish after the read, the breaker created since is dropped
  if (res.code() == ResultCode::NOT_FOUND) {
    LOG(INFO) << "cluster " << key << " is gone, dropping its local state";
    forget(key);
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief drops all local state kept for a cluster
////////////////////////////////////////////////////////////////////////////////

void Reconciler::forget (const string& key) {
  _engine.forget(key);
  _breakers.remove(key);

  if (_monitor != nullptr) {
    _monitor->unwatch(key);
  }

  lock_guard<mutex> lock(_lock);
  _lastSplitBrainCheck.erase(key);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

Result Reconciler::doReconcile (const string& key, ReconcileOutcome& outcome) {
  ClusterResource cluster;
  Result res = _platform.getCluster(key, cluster);

  if (res.isError()) {
    if (res.code() == ResultCode::NOT_FOUND) {
      LOG(INFO) << "cluster " << key << " is gone, dropping its local state";
      forget(key);
      return Result::noError();
    }

    return res;
  }

  const int64_t generation = cluster.generation();
  const string previousPhase = cluster.status().phase();
  const bool newGeneration = cluster.status().observed_generation() != generation;

  // .............................................................................
  // topology
  // .............................................................................

  vector<ChildObject> live;
  res = _platform.listChildren(cluster, live);

  if (res.isError()) {
    recordReconcile(key, "error");
    return res;
  }

  const ChildObject* liveStatefulSet = findStatefulSet(cluster, live);
  ValidationResult validation
    = _validator.validate(cluster, previousPrimaries(liveStatefulSet));

  if (! validation.ok) {
    string message = join(validation.errors, "; ");

    LOG(WARNING)
    << "topology of " << key << " is invalid: " << message;

    outcome.phase = PHASE_FAILED;

    res = _updater.updateStatus(key, [&] (ClusterStatus& status) {
      string now = toRFC3339(chrono::system_clock::now());

      status.set_phase(PHASE_FAILED);
      status.set_message(message);
      status.set_observed_generation(generation);

      setCondition(status, CONDITION_TOPOLOGY_VALID, STATUS_FALSE,
                   REASON_INVALID_TOPOLOGY, message, generation, now);
      setCondition(status, CONDITION_READY, STATUS_FALSE,
                   REASON_INVALID_TOPOLOGY, message, generation, now);
    });

    if (_monitor != nullptr) {
      _monitor->unwatch(key);
    }

    if (res.isError()) {
      recordReconcile(key, "error");
      return res;
    }

    if (newGeneration || previousPhase != PHASE_FAILED) {
      publishEvent(_platform, cluster, EVENT_WARNING, EVENT_VALIDATION_FAILED,
                   message);
    }

    recordReconcile(key, "invalid");
    return res;
  }

  for (const auto& warning : validation.warnings) {
    LOG(WARNING) << "topology of " << key << ": " << warning;
  }

  string topologyMessage = validation.warnings.empty()
                         ? string("Topology accepted")
                         : join(validation.warnings, " ");

  if (! validation.warnings.empty() && newGeneration) {
    publishEvent(_platform, cluster, EVENT_WARNING, EVENT_TOPOLOGY_WARNING,
                 topologyMessage);
  }

  // .............................................................................
  // convergence
  // .............................................................................

  vector<ChildObject> desired = _builder.desiredState(cluster);
  ConvergeResult converged;

  res = _engine.converge(desired, live, validation.transition, converged);

  if (res.isError()) {
    string message = "cannot converge child objects: " + res.errorMessage();

    outcome.phase = PHASE_FAILED;

    Result statusRes = _updater.updateStatus(key, [&] (ClusterStatus& status) {
      string now = toRFC3339(chrono::system_clock::now());

      status.set_phase(PHASE_FAILED);
      status.set_message(message);
      status.set_observed_generation(generation);

      setCondition(status, CONDITION_TOPOLOGY_VALID, STATUS_TRUE,
                   REASON_TOPOLOGY_ACCEPTED, topologyMessage, generation, now);
      setCondition(status, CONDITION_READY, STATUS_FALSE,
                   REASON_RECONCILIATION_FAILED, message, generation, now);
    });

    if (statusRes.isError()) {
      LOG(WARNING)
      << "cannot record convergence failure of " << key << ": "
      << statusRes.toString();
    }

    recordReconcile(key, "error");
    return res;
  }

  // .............................................................................
  // phase
  // .............................................................................

  const int32_t expected = expectedServers(cluster.spec());
  const string image = imageReference(cluster.spec());
  const string oldImage = liveImage(liveStatefulSet);

  vector<Member> members;
  res = _platform.listMembers(cluster, members);

  if (res.isError()) {
    LOG(WARNING)
    << "cannot list members of " << key << ": " << res.toString();
    members.clear();
  }

  int32_t running = 0;

  for (const auto& member : members) {
    if (member.running()) {
      ++running;
    }
  }

  string phase;
  string message;
  int32_t ready = running;
  bool answered = false;
  int healthy = 0;

  if (! oldImage.empty() && oldImage != image) {
    phase = PHASE_UPGRADING;
    message = "Upgrading from " + oldImage + " to " + image;
  }
  else if (previousPhase == PHASE_UPGRADING && running < expected) {
    phase = PHASE_UPGRADING;
    message = "Upgrading to " + image + ", " + to_string(running) + " of "
            + to_string(expected) + " servers running";
  }
  else if (running < expected) {
    phase = PHASE_FORMING;
    message = to_string(running) + " of " + to_string(expected)
            + " servers running";
  }
  else {
    res = countHealthyServers(cluster, healthy);

    if (res.isError()) {
      phase = PHASE_FORMING;
      message = "Waiting for the cluster to answer: " + res.errorMessage();
    }
    else if (healthy < expected) {
      answered = true;
      ready = healthy;
      phase = PHASE_FORMING;
      message = to_string(healthy) + " of " + to_string(expected)
              + " servers are Enabled and Available";
    }
    else {
      answered = true;
      ready = healthy;
      phase = PHASE_READY;
      message = "Cluster is ready";
    }
  }

  // .............................................................................
  // membership
  // .............................................................................

  // a partitioned member is missing from the client service view, so a
  // shortfall of healthy servers always asks every member
  bool membershipChecked = false;
  ConditionValue membership;

  if (answered
      && (healthy < expected
          || previousPhase == PHASE_DEGRADED
          || splitBrainDue(key))) {
    SplitBrainResult split = _detector.detect(cluster, members);
    membershipChecked = true;

    switch (split.verdict) {
      case SplitBrainVerdict::HEALTHY:
        membership = ConditionValue{ STATUS_TRUE, REASON_MEMBERSHIP_AGREED,
                                     split.message };
        break;

      case SplitBrainVerdict::UNKNOWN:
        membership = ConditionValue{ STATUS_UNKNOWN, REASON_INSUFFICIENT_VIEWS,
                                     split.message };
        break;

      case SplitBrainVerdict::SPLIT: {
        membership = ConditionValue{ STATUS_FALSE, REASON_SPLIT_BRAIN_DETECTED,
                                     split.message };
        phase = PHASE_DEGRADED;
        message = split.message;

        int deleted = _detector.repair(cluster, split);

        LOG(WARNING)
        << "restarted " << deleted << " of " << split.minority.size()
        << " minority member(s) of " << key;
        break;
      }
    }
  }

  // .............................................................................
  // status
  // .............................................................................

  outcome.phase = phase;

  const int32_t primaries = cluster.spec().topology().primaries();
  const int32_t secondaries = cluster.spec().topology().secondaries();
  const string clientHost = clientServiceHost(cluster);
  const string headlessHost = headlessServiceName(cluster) + "."
                            + cluster.ns() + ".svc.cluster.local";

  res = _updater.updateStatus(key, [&] (ClusterStatus& status) {
    string now = toRFC3339(chrono::system_clock::now());

    status.set_phase(phase);
    status.set_message(message);
    status.set_observed_generation(generation);

    Replicas* replicas = status.mutable_replicas();
    replicas->set_primaries(primaries);
    replicas->set_secondaries(secondaries);
    replicas->set_ready(ready);

    Endpoints* endpoints = status.mutable_endpoints();
    endpoints->set_bolt("bolt://" + clientHost + ":7687");
    endpoints->set_http("http://" + clientHost + ":7474");
    endpoints->set_headless(headlessHost);

    setCondition(status, CONDITION_TOPOLOGY_VALID, STATUS_TRUE,
                 REASON_TOPOLOGY_ACCEPTED, topologyMessage, generation, now);
    setCondition(status, CONDITION_READY, readyStatus(phase),
                 readyReason(phase), message, generation, now);

    if (membershipChecked) {
      setCondition(status, CONDITION_MEMBERSHIP_CONSISTENT, membership.status,
                   membership.reason, membership.message, generation, now);
    }
  });

  if (res.code() == ResultCode::NOT_FOUND) {
    LOG(INFO) << "cluster " << key << " is gone, dropping its local state";
    forget(key);
    return Result::noError();
  }

  if (res.isError()) {
    recordReconcile(key, "error");
    return res;
  }

  if (phase == PHASE_READY && previousPhase != PHASE_READY) {
    publishEvent(_platform, cluster, EVENT_NORMAL, EVENT_CLUSTER_READY,
                 "all " + to_string(expected) + " servers are Enabled and Available");
  }

  // .............................................................................
  // diagnostics
  // .............................................................................

  if (phase == PHASE_READY) {
    if (_monitor != nullptr) {
      _monitor->watch(key);
    }

    if (collectDiagnostics(cluster).code() == ResultCode::NOT_FOUND) {
      LOG(INFO) << "cluster " << key << " is gone, dropping its local state";
      forget(key);
      return Result::noError();
    }
  }
  else if (_monitor != nullptr) {
    _monitor->unwatch(key);
  }

  // .............................................................................
  // requeue
  // .............................................................................

  chrono::steady_clock::duration after = chrono::steady_clock::duration::zero();

  if (phase == PHASE_FORMING || phase == PHASE_UPGRADING) {
    after = _options.formingRequeue;
  }
  else if (phase == PHASE_DEGRADED) {
    after = _options.degradedRequeue;
  }
  else if (phase == PHASE_READY) {
    after = _options.splitBrainInterval;
  }

  if (converged.recheckAfter > chrono::steady_clock::duration::zero()
      && (after == chrono::steady_clock::duration::zero()
          || converged.recheckAfter < after)) {
    after = converged.recheckAfter;
  }

  outcome.requeueAfter = after;

  recordReconcile(key, "success");
  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief connects to the client service through the cluster's breaker
////////////////////////////////////////////////////////////////////////////////

Result Reconciler::connect (const ClusterResource& cluster,
                            unique_ptr<ProtocolClient>& client) {
  auto breaker = _breakers.get(clusterKey(cluster.ns(), cluster.name()));
  string host = clientServiceHost(cluster);

  return breaker->execute([this, &host, &client] () {
    return _factory.create(host, client);
  });
}

////////////////////////////////////////////////////////////////////////////////
/// @brief number of Enabled and Available servers seen by the client service
////////////////////////////////////////////////////////////////////////////////

Result Reconciler::countHealthyServers (const ClusterResource& cluster,
                                        int& healthy) {
  healthy = 0;

  unique_ptr<ProtocolClient> client;
  Result res = connect(cluster, client);

  if (res.isError()) {
    return res;
  }

  auto breaker = _breakers.get(clusterKey(cluster.ns(), cluster.name()));
  auto timeout = _options.queryTimeout;
  vector<ServerDiagnostic> servers;

  res = breaker->execute([&client, &servers, timeout] () {
    return client->listServers(timeout, servers);
  });

  client->close();

  if (res.isError()) {
    return res;
  }

  for (const auto& server : servers) {
    if (isHealthy(server)) {
      ++healthy;
    }
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief runs the diagnostics collector, failures are logged and returned
////////////////////////////////////////////////////////////////////////////////

Result Reconciler::collectDiagnostics (const ClusterResource& cluster) {
  string key = clusterKey(cluster.ns(), cluster.name());
  unique_ptr<ProtocolClient> client;
  Result res = connect(cluster, client);

  if (res.isError()) {
    res = _collector.recordUnavailable(cluster, res);
  }
  else {
    res = _collector.collect(cluster, *client);
    client->close();
  }

  if (res.isError()) {
    LOG(WARNING)
    << "cannot record diagnostics of " << key << ": " << res.toString();
  }

  return res;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief true at most once per split-brain interval
////////////////////////////////////////////////////////////////////////////////

bool Reconciler::splitBrainDue (const string& key) {
  lock_guard<mutex> lock(_lock);

  auto now = _clock();
  auto it = _lastSplitBrainCheck.find(key);

  if (it != _lastSplitBrainCheck.end()
      && now - it->second < _options.splitBrainInterval) {
    return false;
  }

  _lastSplitBrainCheck[key] = now;
  return true;
}

void Reconciler::recordReconcile (const string& key, const string& result) {
  string ns;
  string name;

  if (splitClusterKey(key, ns, name)) {
    _metrics.reconcileTotal->inc({ name, ns, result });
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
