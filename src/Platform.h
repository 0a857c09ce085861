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

#ifndef NEO4J_PLATFORM_H
#define NEO4J_PLATFORM_H 1

#include "Result.h"
#include "neo4j.pb.h"

#include <string>
#include <vector>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                                   child kinds
// -----------------------------------------------------------------------------

  extern const char* const KIND_STATEFUL_SET;
  extern const char* const KIND_SERVICE;
  extern const char* const KIND_CONFIG_MAP;

// -----------------------------------------------------------------------------
// --SECTION--                                                           events
// -----------------------------------------------------------------------------

  extern const char* const EVENT_NORMAL;
  extern const char* const EVENT_WARNING;

  extern const char* const EVENT_CLUSTER_READY;
  extern const char* const EVENT_TOPOLOGY_WARNING;
  extern const char* const EVENT_VALIDATION_FAILED;
  extern const char* const EVENT_SPLIT_BRAIN_DETECTED;
  extern const char* const EVENT_SPLIT_BRAIN_REPAIRED;
  extern const char* const EVENT_SPLIT_BRAIN_REPAIR_FAILED;

// -----------------------------------------------------------------------------
// --SECTION--                                                   class Platform
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief access to the cluster resources, their child objects and member
/// pods
///
/// Writes of the cluster status are optimistic: updateClusterStatus fails
/// with CONFLICT if the resource version of the given resource is no longer
/// the current one.
////////////////////////////////////////////////////////////////////////////////

  class Platform {
    public:

      virtual ~Platform () {
      }

    public:

      virtual Result getCluster (const std::string& key,
                                 ClusterResource& result) = 0;

      virtual Result listClusters (std::vector<ClusterResource>& result) = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief writes the status, on success the new resource version is stored
/// in cluster
////////////////////////////////////////////////////////////////////////////////

      virtual Result updateClusterStatus (ClusterResource& cluster) = 0;

      virtual Result listChildren (const ClusterResource& cluster,
                                   std::vector<ChildObject>& result) = 0;

      virtual Result createChild (ChildObject& child) = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief replaces a child object, the resource version of child must match
////////////////////////////////////////////////////////////////////////////////

      virtual Result updateChild (ChildObject& child) = 0;

      virtual Result listMembers (const ClusterResource& cluster,
                                  std::vector<Member>& result) = 0;

      virtual Result deletePod (const std::string& ns,
                                const std::string& name) = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief records an event on the cluster resource
///
/// type is EVENT_NORMAL or EVENT_WARNING.
////////////////////////////////////////////////////////////////////////////////

      virtual Result recordEvent (const ClusterResource& cluster,
                                  const std::string& type,
                                  const std::string& reason,
                                  const std::string& message) = 0;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief records an event, a failure is logged and otherwise ignored
////////////////////////////////////////////////////////////////////////////////

  void publishEvent (Platform& platform,
                     const ClusterResource& cluster,
                     const std::string& type,
                     const std::string& reason,
                     const std::string& message);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
