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

#include "HttpProtocolClient.h"

#include "utils.h"

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                         class HttpProtocolClient
// -----------------------------------------------------------------------------

HttpProtocolClient::HttpProtocolClient (const string& host,
                                        int port,
                                        bool tls,
                                        const string& caFile)
  : _host(host),
    _port(port),
    _tls(tls),
    _caFile(caFile),
    _connected(false) {
}

////////////////////////////////////////////////////////////////////////////////
/// @brief stores the credentials and checks them with a trivial query
////////////////////////////////////////////////////////////////////////////////

Result HttpProtocolClient::connect (const Credentials& credentials,
                                    chrono::milliseconds timeout) {
  _credentials = credentials;
  _connected = true;

  Result res = verifyConnectivity(timeout);

  if (res.isError()) {
    _connected = false;
  }

  return res;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief runs a statement in an auto-commit transaction
////////////////////////////////////////////////////////////////////////////////

Result HttpProtocolClient::query (const string& statement,
                                  chrono::milliseconds timeout,
                                  QueryResult& result) {
  if (! _connected) {
    return Result::error(ResultCode::UNAVAILABLE,
                         "client for " + _host + " is not connected");
  }

  string url = string(_tls ? "https" : "http") + "://" + _host + ":"
             + to_string(_port) + "/db/system/tx/commit";

  picojson::object s;
  s["statement"] = picojson::value(statement);

  picojson::array statements;
  statements.push_back(picojson::value(s));

  picojson::object request;
  request["statements"] = picojson::value(statements);

  HttpOptions options;
  options.timeoutMs = (long) timeout.count();
  options.caFile = _caFile;
  options.basicAuth = _credentials.user + ":" + _credentials.password;
  options.headers.push_back("Content-Type: application/json");
  options.headers.push_back("Accept: application/json;charset=UTF-8");

  string body;
  long httpCode = 0;
  int res = doHTTPRequest("POST", url, picojson::value(request).serialize(),
                          options, body, httpCode);

  if (res != 0) {
    if (isHTTPTimeout(res)) {
      return Result::error(ResultCode::TIMEOUT,
                           "query on " + _host + " timed out after "
                           + to_string(timeout.count()) + "ms");
    }

    return Result::error(ResultCode::UNAVAILABLE,
                         "cannot reach " + _host + ", curl error "
                         + to_string(res));
  }

  if (httpCode == 401 || httpCode == 403) {
    return Result::error(ResultCode::AUTH,
                         "authentication against " + _host + " failed");
  }

  if (httpCode != 200) {
    return Result::error(ResultCode::UNAVAILABLE,
                         "unexpected HTTP status " + to_string(httpCode)
                         + " from " + _host);
  }

  return parseResponse(body, result);
}

void HttpProtocolClient::close () {
  _connected = false;
  _credentials = Credentials();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief parses the answer of the transaction endpoint
////////////////////////////////////////////////////////////////////////////////

Result HttpProtocolClient::parseResponse (const string& body,
                                          QueryResult& result) {
  picojson::value v;
  string err = picojson::parse(v, body);

  if (! err.empty()) {
    return Result::error(ResultCode::QUERY, "malformed response: " + err);
  }

  if (! v.is<picojson::object>()) {
    return Result::error(ResultCode::QUERY, "response is not a json object");
  }

  const auto& errors = v.get("errors");

  if (errors.is<picojson::array>() && ! errors.get<picojson::array>().empty()) {
    const auto& first = errors.get<picojson::array>()[0];
    string code;
    string message;

    if (first.is<picojson::object>()) {
      code = first.contains("code") ? first.get("code").to_str() : "";
      message = first.contains("message") ? first.get("message").to_str() : "";
    }

    if (code.find("Security") != string::npos) {
      return Result::error(ResultCode::AUTH, code + ": " + message);
    }

    return Result::error(ResultCode::QUERY, code + ": " + message);
  }

  const auto& results = v.get("results");

  if (! results.is<picojson::array>() || results.get<picojson::array>().empty()) {
    return Result::error(ResultCode::QUERY, "response contains no results");
  }

  const auto& first = results.get<picojson::array>()[0];

  if (! first.is<picojson::object>()) {
    return Result::error(ResultCode::QUERY, "result is not a json object");
  }

  result.columns.clear();
  result.rows.clear();

  if (first.get("columns").is<picojson::array>()) {
    for (const auto& c : first.get("columns").get<picojson::array>()) {
      result.columns.push_back(c.to_str());
    }
  }

  if (first.get("data").is<picojson::array>()) {
    for (const auto& d : first.get("data").get<picojson::array>()) {
      if (d.is<picojson::object>() && d.get("row").is<picojson::array>()) {
        result.rows.push_back(d.get("row").get<picojson::array>());
      }
    }
  }

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                  class HttpProtocolClientFactory
// -----------------------------------------------------------------------------

HttpProtocolClientFactory::HttpProtocolClientFactory (
  const Credentials& credentials,
  chrono::milliseconds connectTimeout,
  int port,
  bool tls,
  const string& caFile)
  : _credentials(credentials),
    _connectTimeout(connectTimeout),
    _port(port),
    _tls(tls),
    _caFile(caFile) {
}

Result HttpProtocolClientFactory::create (const string& host,
                                          unique_ptr<ProtocolClient>& client) {
  unique_ptr<ProtocolClient> c(new HttpProtocolClient(host, _port, _tls, _caFile));
  Result res = c->connect(_credentials, _connectTimeout);

  if (res.isError()) {
    LOG(WARNING)
    << "cannot connect to " << host << ": " << res.toString();
    return res;
  }

  client = move(c);
  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
