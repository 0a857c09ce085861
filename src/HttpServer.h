////////////////////////////////////////////////////////////////////////////////
/// @brief http server for health, cluster overview and metrics
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

#ifndef NEO4J_HTTP_SERVER_H
#define NEO4J_HTTP_SERVER_H 1

#include "Result.h"

#include <microhttpd.h>

#include <string>

// -----------------------------------------------------------------------------
// --SECTION--                                                  class HttpServer
// -----------------------------------------------------------------------------

namespace neo4j {
  class ClusterController;
  class MetricsRegistry;

////////////////////////////////////////////////////////////////////////////////
/// @brief http server class
///
/// Serves GET /v1/health.json, GET /v1/clusters.json and GET /metrics.
////////////////////////////////////////////////////////////////////////////////

  class HttpServer {
    HttpServer (const HttpServer&) = delete;
    HttpServer& operator= (const HttpServer&) = delete;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      HttpServer (ClusterController& controller, MetricsRegistry& metrics);

      ~HttpServer ();

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief starts the server on a given port
////////////////////////////////////////////////////////////////////////////////

      Result start (int port);

////////////////////////////////////////////////////////////////////////////////
/// @brief stops the server
////////////////////////////////////////////////////////////////////////////////

      void stop ();

////////////////////////////////////////////////////////////////////////////////
/// @brief answers a request, returns the HTTP status
////////////////////////////////////////////////////////////////////////////////

      int handle (const std::string& method,
                  const std::string& url,
                  std::string& body,
                  std::string& contentType);

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      std::string GET_V1_HEALTH ();

      std::string GET_V1_CLUSTERS ();

      std::string GET_METRICS ();

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      ClusterController& _controller;

      MetricsRegistry& _metrics;

////////////////////////////////////////////////////////////////////////////////
/// @brief http daemon
////////////////////////////////////////////////////////////////////////////////

      MHD_Daemon* _daemon;
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
