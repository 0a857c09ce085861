////////////////////////////////////////////////////////////////////////////////
/// @brief platform implementation on the kubernetes api
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

#ifndef NEO4J_KUBE_PLATFORM_H
#define NEO4J_KUBE_PLATFORM_H 1

#include "Platform.h"

#include <string>

#include <picojson.h>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                               class KubePlatform
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief talks to the kubernetes REST api using libcurl
////////////////////////////////////////////////////////////////////////////////

  class KubePlatform : public Platform {
    KubePlatform (const KubePlatform&) = delete;
    KubePlatform& operator= (const KubePlatform&) = delete;

    public:

      struct Options {
        Options ()
          : timeoutMs(10000) {
        }

        std::string apiServer;
        std::string token;
        std::string caFile;

        // empty means all namespaces
        std::string ns;

        long timeoutMs;
      };

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      explicit KubePlatform (const Options& options);

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

      Result getCluster (const std::string& key,
                         ClusterResource& result) override;

      Result listClusters (std::vector<ClusterResource>& result) override;

      Result updateClusterStatus (ClusterResource& cluster) override;

      Result listChildren (const ClusterResource& cluster,
                           std::vector<ChildObject>& result) override;

      Result createChild (ChildObject& child) override;

////////////////////////////////////////////////////////////////////////////////
/// @brief updates a child object with a merge patch
///
/// The patch carries the resourceVersion of the read, fields set by the
/// server (such as the clusterIP of a service) are left alone.
////////////////////////////////////////////////////////////////////////////////

      Result updateChild (ChildObject& child) override;

      Result listMembers (const ClusterResource& cluster,
                          std::vector<Member>& result) override;

      Result deletePod (const std::string& ns, const std::string& name) override;

////////////////////////////////////////////////////////////////////////////////
/// @brief creates a core/v1 event which refers to the cluster resource
////////////////////////////////////////////////////////////////////////////////

      Result recordEvent (const ClusterResource& cluster,
                          const std::string& type,
                          const std::string& reason,
                          const std::string& message) override;

// -----------------------------------------------------------------------------
// --SECTION--                                            static public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief maps an HTTP status of the api server to a result
////////////////////////////////////////////////////////////////////////////////

      static Result fromHttpCode (long httpCode, const std::string& what);

////////////////////////////////////////////////////////////////////////////////
/// @brief collection path of a child kind, for example
/// /apis/apps/v1/namespaces/<ns>/statefulsets
////////////////////////////////////////////////////////////////////////////////

      static std::string childPath (const std::string& kind,
                                    const std::string& ns);

      static std::string apiVersionOf (const std::string& kind);

////////////////////////////////////////////////////////////////////////////////
/// @brief body of an event about cluster, stamped with now
////////////////////////////////////////////////////////////////////////////////

      static picojson::value encodeEvent (const ClusterResource& cluster,
                                          const std::string& type,
                                          const std::string& reason,
                                          const std::string& message,
                                          const std::string& now);

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      Result request (const std::string& method,
                      const std::string& path,
                      const std::string& body,
                      const std::string& contentType,
                      picojson::value& result);

      std::string clusterPath (const std::string& ns) const;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      const Options _options;
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
