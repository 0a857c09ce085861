////////////////////////////////////////////////////////////////////////////////
/// @brief status conditions
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

#include "Conditions.h"

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                       constants
// -----------------------------------------------------------------------------

const char* const neo4j::CONDITION_SERVERS_HEALTHY = "ServersHealthy";
const char* const neo4j::CONDITION_DATABASES_HEALTHY = "DatabasesHealthy";
const char* const neo4j::CONDITION_READY = "Ready";
const char* const neo4j::CONDITION_TOPOLOGY_VALID = "TopologyValid";
const char* const neo4j::CONDITION_MEMBERSHIP_CONSISTENT = "MembershipConsistent";

const char* const neo4j::STATUS_TRUE = "True";
const char* const neo4j::STATUS_FALSE = "False";
const char* const neo4j::STATUS_UNKNOWN = "Unknown";

const char* const neo4j::REASON_ALL_SERVERS_HEALTHY = "AllServersHealthy";
const char* const neo4j::REASON_SERVER_DEGRADED = "ServerDegraded";
const char* const neo4j::REASON_ALL_DATABASES_ONLINE = "AllDatabasesOnline";
const char* const neo4j::REASON_DATABASE_OFFLINE = "DatabaseOffline";
const char* const neo4j::REASON_DIAGNOSTICS_UNAVAILABLE = "DiagnosticsUnavailable";
const char* const neo4j::REASON_CLUSTER_READY = "ClusterReady";
const char* const neo4j::REASON_CLUSTER_FORMING = "ClusterForming";
const char* const neo4j::REASON_RECONCILIATION_FAILED = "ReconciliationFailed";
const char* const neo4j::REASON_UPGRADE_IN_PROGRESS = "UpgradeInProgress";
const char* const neo4j::REASON_PENDING = "Pending";
const char* const neo4j::REASON_INVALID_TOPOLOGY = "InvalidTopology";
const char* const neo4j::REASON_TOPOLOGY_ACCEPTED = "TopologyAccepted";
const char* const neo4j::REASON_SPLIT_BRAIN_DETECTED = "SplitBrainDetected";
const char* const neo4j::REASON_MEMBERSHIP_AGREED = "MembershipAgreed";
const char* const neo4j::REASON_INSUFFICIENT_VIEWS = "InsufficientViews";

const char* const neo4j::PHASE_PENDING = "Pending";
const char* const neo4j::PHASE_FORMING = "Forming";
const char* const neo4j::PHASE_READY = "Ready";
const char* const neo4j::PHASE_DEGRADED = "Degraded";
const char* const neo4j::PHASE_FAILED = "Failed";
const char* const neo4j::PHASE_UPGRADING = "Upgrading";

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief inserts or updates a condition
////////////////////////////////////////////////////////////////////////////////

bool neo4j::setCondition (ClusterStatus& status,
                          const string& type,
                          const string& conditionStatus,
                          const string& reason,
                          const string& message,
                          int64_t observedGeneration,
                          const string& now) {
  for (int i = 0; i < status.conditions_size(); ++i) {
    Condition* existing = status.mutable_conditions(i);

    if (existing->type() != type) {
      continue;
    }

    if (existing->status() == conditionStatus && existing->reason() == reason) {
      bool changed = existing->message() != message
                  || existing->observed_generation() != observedGeneration;

      existing->set_message(message);
      existing->set_observed_generation(observedGeneration);

      return changed;
    }

    existing->set_status(conditionStatus);
    existing->set_reason(reason);
    existing->set_message(message);
    existing->set_observed_generation(observedGeneration);
    existing->set_last_transition_time(now);

    return true;
  }

  Condition* condition = status.add_conditions();
  condition->set_type(type);
  condition->set_status(conditionStatus);
  condition->set_reason(reason);
  condition->set_message(message);
  condition->set_observed_generation(observedGeneration);
  condition->set_last_transition_time(now);

  return true;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief finds a condition by type
////////////////////////////////////////////////////////////////////////////////

const Condition* neo4j::findCondition (const ClusterStatus& status,
                                       const string& type) {
  for (const auto& condition : status.conditions()) {
    if (condition.type() == type) {
      return &condition;
    }
  }

  return nullptr;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief removes a condition by type
////////////////////////////////////////////////////////////////////////////////

bool neo4j::removeCondition (ClusterStatus& status, const string& type) {
  auto* conditions = status.mutable_conditions();

  for (int i = 0; i < conditions->size(); ++i) {
    if (conditions->Get(i).type() == type) {
      conditions->DeleteSubrange(i, 1);
      return true;
    }
  }

  return false;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief maps a phase onto the status of the Ready condition
////////////////////////////////////////////////////////////////////////////////

string neo4j::phaseToConditionStatus (const string& phase) {
  if (phase == PHASE_READY) {
    return STATUS_TRUE;
  }

  if (phase == PHASE_FAILED || phase == PHASE_DEGRADED) {
    return STATUS_FALSE;
  }

  return STATUS_UNKNOWN;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
