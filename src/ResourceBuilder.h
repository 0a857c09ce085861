////////////////////////////////////////////////////////////////////////////////
/// @brief desired child objects of a cluster
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

#ifndef NEO4J_RESOURCE_BUILDER_H
#define NEO4J_RESOURCE_BUILDER_H 1

#include "neo4j.pb.h"

#include <string>
#include <vector>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                          labels and annotations
// -----------------------------------------------------------------------------

  extern const char* const LABEL_NAME;
  extern const char* const LABEL_INSTANCE;
  extern const char* const LABEL_MANAGED_BY;
  extern const char* const LABEL_COMPONENT;
  extern const char* const LABEL_CLUSTER;
  extern const char* const LABEL_CLUSTERING;

  extern const char* const MANAGED_BY_VALUE;

  extern const char* const ANNOTATION_APPLIED_HASH;
  extern const char* const ANNOTATION_PRIMARIES;
  extern const char* const ANNOTATION_IMAGE;
  extern const char* const ANNOTATION_CONFIG_HASH;
  extern const char* const ANNOTATION_RESTARTED_AT;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

  std::string statefulSetName (const ClusterResource&);
  std::string headlessServiceName (const ClusterResource&);
  std::string clientServiceName (const ClusterResource&);
  std::string configMapName (const ClusterResource&);

////////////////////////////////////////////////////////////////////////////////
/// @brief DNS name of the load balanced client service
////////////////////////////////////////////////////////////////////////////////

  std::string clientServiceHost (const ClusterResource&);

////////////////////////////////////////////////////////////////////////////////
/// @brief DNS name of a member pod behind the headless service
////////////////////////////////////////////////////////////////////////////////

  std::string memberHost (const ClusterResource&, const std::string& podName);

////////////////////////////////////////////////////////////////////////////////
/// @brief image reference "repo:tag"
////////////////////////////////////////////////////////////////////////////////

  std::string imageReference (const ClusterSpec&);

////////////////////////////////////////////////////////////////////////////////
/// @brief total number of servers of a cluster
////////////////////////////////////////////////////////////////////////////////

  int32_t expectedServers (const ClusterSpec&);

// -----------------------------------------------------------------------------
// --SECTION--                                            class ResourceBuilder
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief computes the desired child objects of a cluster
///
/// All methods are pure functions of the cluster resource: the same input
/// yields byte-identical objects.
////////////////////////////////////////////////////////////////////////////////

  class ResourceBuilder {
    public:

      virtual ~ResourceBuilder () {
      }

    public:

      virtual ChildObject buildStatefulSet (const ClusterResource&) const = 0;

      virtual ChildObject buildHeadlessService (const ClusterResource&) const = 0;

      virtual ChildObject buildClientService (const ClusterResource&) const = 0;

      virtual ChildObject buildConfigMap (const ClusterResource&) const = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief all desired child objects, configuration first
////////////////////////////////////////////////////////////////////////////////

      std::vector<ChildObject> desiredState (const ClusterResource&) const;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                     class DefaultResourceBuilder
// -----------------------------------------------------------------------------

  class DefaultResourceBuilder : public ResourceBuilder {
    public:

      ChildObject buildStatefulSet (const ClusterResource&) const override;

      ChildObject buildHeadlessService (const ClusterResource&) const override;

      ChildObject buildClientService (const ClusterResource&) const override;

      ChildObject buildConfigMap (const ClusterResource&) const override;

    private:

      std::string neo4jConf (const ClusterResource&) const;

      std::string startupScript (const ClusterResource&) const;
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
