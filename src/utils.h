////////////////////////////////////////////////////////////////////////////////
/// @brief utilities
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

#ifndef NEO4J_UTILS_H
#define NEO4J_UTILS_H 1

#include <chrono>
#include <string>
#include <vector>

#include <google/protobuf/message.h>

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

namespace neo4j {
  using namespace std;

////////////////////////////////////////////////////////////////////////////////
/// @brief computes a FNV hash for strings
////////////////////////////////////////////////////////////////////////////////

  uint64_t FnvHashString (const vector<string>& texts);

////////////////////////////////////////////////////////////////////////////////
/// @brief hex representation of a hash value
////////////////////////////////////////////////////////////////////////////////

  string toHex (uint64_t);

////////////////////////////////////////////////////////////////////////////////
/// @brief splits a string
////////////////////////////////////////////////////////////////////////////////

  vector<string> split (const string&, char separator);

////////////////////////////////////////////////////////////////////////////////
/// @brief joins a vector of string
////////////////////////////////////////////////////////////////////////////////

  string join (const vector<string>&, string separator);

////////////////////////////////////////////////////////////////////////////////
/// @brief jsonify a protobuf message
////////////////////////////////////////////////////////////////////////////////

  string toJson (::google::protobuf::Message const&);

////////////////////////////////////////////////////////////////////////////////
/// @brief converts system time into RFC 3339 UTC
////////////////////////////////////////////////////////////////////////////////

  string toRFC3339 (const chrono::system_clock::time_point&);

////////////////////////////////////////////////////////////////////////////////
/// @brief key of a cluster resource, "namespace/name"
////////////////////////////////////////////////////////////////////////////////

  string clusterKey (const string& ns, const string& name);

////////////////////////////////////////////////////////////////////////////////
/// @brief splits a cluster key, returns false if the key is malformed
////////////////////////////////////////////////////////////////////////////////

  bool splitClusterKey (const string& key, string& ns, string& name);

////////////////////////////////////////////////////////////////////////////////
/// @brief removes trailing whitespace
////////////////////////////////////////////////////////////////////////////////

  string trimRight (const string&);

////////////////////////////////////////////////////////////////////////////////
/// @brief options for an HTTP request
////////////////////////////////////////////////////////////////////////////////

  struct HttpOptions {
    HttpOptions ()
      : timeoutMs(10000), insecure(false) {
    }

    long timeoutMs;
    bool insecure;
    string bearerToken;
    string basicAuth;
    string caFile;
    vector<string> headers;
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief do an HTTP request using libcurl, a return value of 0 means OK,
/// the body of the result is in resultBody and the status in httpCode. If
/// libcurl did not initialise properly, -1 is returned. Otherwise, a
/// positive libcurl error code (see man 3 libcurl-errors) is returned.
////////////////////////////////////////////////////////////////////////////////

  int doHTTPRequest (const string& method,
                     const string& url,
                     const string& body,
                     const HttpOptions& options,
                     string& resultBody,
                     long& httpCode);

////////////////////////////////////////////////////////////////////////////////
/// @brief percent-encodes a query parameter
////////////////////////////////////////////////////////////////////////////////

  string urlEncode (const string&);

////////////////////////////////////////////////////////////////////////////////
/// @brief true if the curl result code of doHTTPRequest is a timeout
////////////////////////////////////////////////////////////////////////////////

  bool isHTTPTimeout (int);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
