////////////////////////////////////////////////////////////////////////////////
/// @brief protocol client using the HTTP transaction endpoint
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

#ifndef NEO4J_HTTP_PROTOCOL_CLIENT_H
#define NEO4J_HTTP_PROTOCOL_CLIENT_H 1

#include "ProtocolClient.h"

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                         class HttpProtocolClient
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief client talking to /db/system/tx/commit of one server or service
////////////////////////////////////////////////////////////////////////////////

  class HttpProtocolClient : public ProtocolClient {
    public:

      HttpProtocolClient (const std::string& host,
                          int port,
                          bool tls,
                          const std::string& caFile);

    public:

      Result connect (const Credentials&,
                      std::chrono::milliseconds timeout) override;

      Result query (const std::string& statement,
                    std::chrono::milliseconds timeout,
                    QueryResult& result) override;

      void close () override;

      std::string host () const override {
        return _host;
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief parses the answer of the transaction endpoint
////////////////////////////////////////////////////////////////////////////////

      static Result parseResponse (const std::string& body, QueryResult& result);

    private:

      const std::string _host;
      const int _port;
      const bool _tls;
      const std::string _caFile;

      bool _connected;
      Credentials _credentials;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                  class HttpProtocolClientFactory
// -----------------------------------------------------------------------------

  class HttpProtocolClientFactory : public ProtocolClientFactory {
    public:

      HttpProtocolClientFactory (const Credentials& credentials,
                                 std::chrono::milliseconds connectTimeout,
                                 int port = 7474,
                                 bool tls = false,
                                 const std::string& caFile = "");

    public:

      Result create (const std::string& host,
                     std::unique_ptr<ProtocolClient>& client) override;

    private:

      const Credentials _credentials;
      const std::chrono::milliseconds _connectTimeout;
      const int _port;
      const bool _tls;
      const std::string _caFile;
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
