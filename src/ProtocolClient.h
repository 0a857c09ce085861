////////////////////////////////////////////////////////////////////////////////
/// @brief database protocol client
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

#ifndef NEO4J_PROTOCOL_CLIENT_H
#define NEO4J_PROTOCOL_CLIENT_H 1

#include "Result.h"
#include "neo4j.pb.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <picojson.h>

namespace neo4j {

////////////////////////////////////////////////////////////////////////////////
/// @brief database credentials
////////////////////////////////////////////////////////////////////////////////

  struct Credentials {
    std::string user;
    std::string password;
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief rows returned by a query
////////////////////////////////////////////////////////////////////////////////

  struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<picojson::value>> rows;

////////////////////////////////////////////////////////////////////////////////
/// @brief index of a column, -1 if there is no such column
////////////////////////////////////////////////////////////////////////////////

    int column (const std::string& name) const;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                             class ProtocolClient
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief session with one database server or service
///
/// Every call carries its own deadline. Errors are CONNECTION (UNAVAILABLE),
/// TIMEOUT, AUTH or QUERY.
////////////////////////////////////////////////////////////////////////////////

  class ProtocolClient {
    public:

      virtual ~ProtocolClient () {
      }

    public:

      virtual Result connect (const Credentials&,
                              std::chrono::milliseconds timeout) = 0;

      virtual Result query (const std::string& statement,
                            std::chrono::milliseconds timeout,
                            QueryResult& result) = 0;

      virtual void close () = 0;

      virtual std::string host () const = 0;

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief SHOW SERVERS
////////////////////////////////////////////////////////////////////////////////

      virtual Result listServers (std::chrono::milliseconds timeout,
                                  std::vector<ServerDiagnostic>& result);

////////////////////////////////////////////////////////////////////////////////
/// @brief SHOW DATABASES
////////////////////////////////////////////////////////////////////////////////

      virtual Result listDatabases (std::chrono::milliseconds timeout,
                                    std::vector<DatabaseDiagnostic>& result);

      virtual Result verifyConnectivity (std::chrono::milliseconds timeout);
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief converts the rows of SHOW SERVERS
////////////////////////////////////////////////////////////////////////////////

  Result toServers (const QueryResult&, std::vector<ServerDiagnostic>&);

////////////////////////////////////////////////////////////////////////////////
/// @brief converts the rows of SHOW DATABASES
////////////////////////////////////////////////////////////////////////////////

  Result toDatabases (const QueryResult&, std::vector<DatabaseDiagnostic>&);

// -----------------------------------------------------------------------------
// --SECTION--                                      class ProtocolClientFactory
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief creates connected clients for a host
////////////////////////////////////////////////////////////////////////////////

  class ProtocolClientFactory {
    public:

      virtual ~ProtocolClientFactory () {
      }

    public:

      virtual Result create (const std::string& host,
                             std::unique_ptr<ProtocolClient>& client) = 0;
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
