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

#ifndef NEO4J_CONDITIONS_H
#define NEO4J_CONDITIONS_H 1

#include "neo4j.pb.h"

#include <string>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                                 condition types
// -----------------------------------------------------------------------------

  extern const char* const CONDITION_SERVERS_HEALTHY;
  extern const char* const CONDITION_DATABASES_HEALTHY;
  extern const char* const CONDITION_READY;
  extern const char* const CONDITION_TOPOLOGY_VALID;
  extern const char* const CONDITION_MEMBERSHIP_CONSISTENT;

// -----------------------------------------------------------------------------
// --SECTION--                                                condition status
// -----------------------------------------------------------------------------

  extern const char* const STATUS_TRUE;
  extern const char* const STATUS_FALSE;
  extern const char* const STATUS_UNKNOWN;

// -----------------------------------------------------------------------------
// --SECTION--                                               condition reasons
// -----------------------------------------------------------------------------

  extern const char* const REASON_ALL_SERVERS_HEALTHY;
  extern const char* const REASON_SERVER_DEGRADED;
  extern const char* const REASON_ALL_DATABASES_ONLINE;
  extern const char* const REASON_DATABASE_OFFLINE;
  extern const char* const REASON_DIAGNOSTICS_UNAVAILABLE;
  extern const char* const REASON_CLUSTER_READY;
  extern const char* const REASON_CLUSTER_FORMING;
  extern const char* const REASON_RECONCILIATION_FAILED;
  extern const char* const REASON_UPGRADE_IN_PROGRESS;
  extern const char* const REASON_PENDING;
  extern const char* const REASON_INVALID_TOPOLOGY;
  extern const char* const REASON_TOPOLOGY_ACCEPTED;
  extern const char* const REASON_SPLIT_BRAIN_DETECTED;
  extern const char* const REASON_MEMBERSHIP_AGREED;
  extern const char* const REASON_INSUFFICIENT_VIEWS;

// -----------------------------------------------------------------------------
// --SECTION--                                                          phases
// -----------------------------------------------------------------------------

  extern const char* const PHASE_PENDING;
  extern const char* const PHASE_FORMING;
  extern const char* const PHASE_READY;
  extern const char* const PHASE_DEGRADED;
  extern const char* const PHASE_FAILED;
  extern const char* const PHASE_UPGRADING;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief inserts or updates a condition
///
/// If a condition of the same type exists and neither status nor reason
/// changed, only message and observed generation are updated and the last
/// transition time is kept. Otherwise the entry is replaced and stamped with
/// the given time. Returns true if anything changed.
////////////////////////////////////////////////////////////////////////////////

  bool setCondition (ClusterStatus& status,
                     const std::string& type,
                     const std::string& conditionStatus,
                     const std::string& reason,
                     const std::string& message,
                     int64_t observedGeneration,
                     const std::string& now);

////////////////////////////////////////////////////////////////////////////////
/// @brief finds a condition by type, returns nullptr if there is none
////////////////////////////////////////////////////////////////////////////////

  const Condition* findCondition (const ClusterStatus&, const std::string& type);

////////////////////////////////////////////////////////////////////////////////
/// @brief removes a condition by type
////////////////////////////////////////////////////////////////////////////////

  bool removeCondition (ClusterStatus&, const std::string& type);

////////////////////////////////////////////////////////////////////////////////
/// @brief maps a phase onto the status of the Ready condition
////////////////////////////////////////////////////////////////////////////////

  std::string phaseToConditionStatus (const std::string& phase);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
