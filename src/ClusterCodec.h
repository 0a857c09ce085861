////////////////////////////////////////////////////////////////////////////////
/// @brief json mapping of the kubernetes objects
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

#ifndef NEO4J_CLUSTER_CODEC_H
#define NEO4J_CLUSTER_CODEC_H 1

#include "Result.h"
#include "neo4j.pb.h"

#include <string>

#include <picojson.h>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                                        constants
// -----------------------------------------------------------------------------

  extern const char* const CLUSTER_GROUP;
  extern const char* const CLUSTER_VERSION;
  extern const char* const CLUSTER_KIND;
  extern const char* const CLUSTER_PLURAL;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief decodes a cluster resource with metadata, spec and status
////////////////////////////////////////////////////////////////////////////////

  Result decodeCluster (const picojson::value&, ClusterResource&);

////////////////////////////////////////////////////////////////////////////////
/// @brief encodes a cluster resource as written to the status subresource
///
/// The metadata carries the resourceVersion, so the write is rejected if
/// the resource changed since it was read.
////////////////////////////////////////////////////////////////////////////////

  picojson::value encodeCluster (const ClusterResource&);

  picojson::value encodeStatus (const ClusterStatus&);

  Result decodeStatus (const picojson::value&, ClusterStatus&);

////////////////////////////////////////////////////////////////////////////////
/// @brief decodes a StatefulSet, Service or ConfigMap
///
/// List responses do not carry kind and apiVersion per item, so both are
/// passed in.
////////////////////////////////////////////////////////////////////////////////

  Result decodeChild (const std::string& kind,
                      const std::string& apiVersion,
                      const picojson::value&,
                      ChildObject&);

  picojson::value encodeChild (const ChildObject&);

////////////////////////////////////////////////////////////////////////////////
/// @brief decodes a pod of a cluster into a member
///
/// A member is running if its pod is in phase Running and has the condition
/// Ready=True.
////////////////////////////////////////////////////////////////////////////////

  Result decodeMember (const ClusterResource& cluster,
                       const picojson::value& pod,
                       Member&);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
