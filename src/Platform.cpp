////////////////////////////////////////////////////////////////////////////////
/// @brief orchestration platform interface
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

#include "Platform.h"

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                   child kinds
// -----------------------------------------------------------------------------

const char* const neo4j::KIND_STATEFUL_SET = "StatefulSet";
const char* const neo4j::KIND_SERVICE = "Service";
const char* const neo4j::KIND_CONFIG_MAP = "ConfigMap";

// -----------------------------------------------------------------------------
// --SECTION--                                                           events
// -----------------------------------------------------------------------------

const char* const neo4j::EVENT_NORMAL = "Normal";
const char* const neo4j::EVENT_WARNING = "Warning";

const char* const neo4j::EVENT_CLUSTER_READY = "ClusterReady";
const char* const neo4j::EVENT_TOPOLOGY_WARNING = "TopologyWarning";
const char* const neo4j::EVENT_VALIDATION_FAILED = "ValidationFailed";
const char* const neo4j::EVENT_SPLIT_BRAIN_DETECTED = "SplitBrainDetected";
const char* const neo4j::EVENT_SPLIT_BRAIN_REPAIRED = "SplitBrainRepaired";
const char* const neo4j::EVENT_SPLIT_BRAIN_REPAIR_FAILED = "SplitBrainRepairFailed";

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

void neo4j::publishEvent (Platform& platform,
                          const ClusterResource& cluster,
                          const string& type,
                          const string& reason,
                          const string& message) {
  Result res = platform.recordEvent(cluster, type, reason, message);

  if (res.isError()) {
    LOG(WARNING)
    << "cannot record event " << reason << " for " << cluster.ns() << "/"
    << cluster.name() << ": " << res.toString();
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
