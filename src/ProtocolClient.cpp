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

#include "ProtocolClient.h"

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

namespace {
  const char* ShowServers
    = "SHOW SERVERS YIELD name, address, state, health, hosting";

  const char* ShowDatabases
    = "SHOW DATABASES YIELD name, currentStatus, requestedStatus, role, default";

  string stringAt (const vector<picojson::value>& row, int column) {
    if (column < 0 || column >= (int) row.size()) {
      return "";
    }

    const picojson::value& v = row[column];

    if (v.is<string>()) {
      return v.get<string>();
    }

    if (v.is<picojson::null>()) {
      return "";
    }

    return v.to_str();
  }

  bool boolAt (const vector<picojson::value>& row, int column) {
    if (column < 0 || column >= (int) row.size()) {
      return false;
    }

    const picojson::value& v = row[column];
    return v.is<bool>() && v.get<bool>();
  }

  int32_t countAt (const vector<picojson::value>& row, int column) {
    if (column < 0 || column >= (int) row.size()) {
      return 0;
    }

    const picojson::value& v = row[column];

    if (v.is<picojson::array>()) {
      return (int32_t) v.get<picojson::array>().size();
    }

    if (v.is<double>()) {
      return (int32_t) v.get<double>();
    }

    return 0;
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                struct QueryResult
// -----------------------------------------------------------------------------

int QueryResult::column (const string& name) const {
  for (size_t i = 0; i < columns.size(); ++i) {
    if (columns[i] == name) {
      return (int) i;
    }
  }

  return -1;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief converts the rows of SHOW SERVERS
////////////////////////////////////////////////////////////////////////////////

Result neo4j::toServers (const QueryResult& rows,
                         vector<ServerDiagnostic>& result) {
  int name = rows.column("name");
  int address = rows.column("address");
  int state = rows.column("state");
  int health = rows.column("health");
  int hosting = rows.column("hosting");

  if (name < 0) {
    return Result::error(ResultCode::QUERY,
                         "SHOW SERVERS returned no 'name' column");
  }

  result.clear();

  for (const auto& row : rows.rows) {
    ServerDiagnostic server;
    server.set_name(stringAt(row, name));
    server.set_address(stringAt(row, address));
    server.set_state(stringAt(row, state));
    server.set_health(stringAt(row, health));
    server.set_hosting_count(countAt(row, hosting));
    result.push_back(server);
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief converts the rows of SHOW DATABASES
////////////////////////////////////////////////////////////////////////////////

Result neo4j::toDatabases (const QueryResult& rows,
                           vector<DatabaseDiagnostic>& result) {
  int name = rows.column("name");
  int status = rows.column("currentStatus");
  int requested = rows.column("requestedStatus");
  int role = rows.column("role");
  int isDefault = rows.column("default");

  if (name < 0) {
    return Result::error(ResultCode::QUERY,
                         "SHOW DATABASES returned no 'name' column");
  }

  result.clear();

  // one row per database and server, keep the first row of each database
  for (const auto& row : rows.rows) {
    string n = stringAt(row, name);
    bool seen = false;

    for (const auto& d : result) {
      if (d.name() == n) {
        seen = true;
        break;
      }
    }

    if (seen) {
      continue;
    }

    DatabaseDiagnostic database;
    database.set_name(n);
    database.set_status(stringAt(row, status));
    database.set_requested_status(stringAt(row, requested));
    database.set_role(stringAt(row, role));
    database.set_is_default(boolAt(row, isDefault));
    result.push_back(database);
  }

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                             class ProtocolClient
// -----------------------------------------------------------------------------

Result ProtocolClient::listServers (chrono::milliseconds timeout,
                                    vector<ServerDiagnostic>& result) {
  QueryResult rows;
  Result res = query(ShowServers, timeout, rows);

  if (res.isError()) {
    return res;
  }

  return toServers(rows, result);
}

Result ProtocolClient::listDatabases (chrono::milliseconds timeout,
                                      vector<DatabaseDiagnostic>& result) {
  QueryResult rows;
  Result res = query(ShowDatabases, timeout, rows);

  if (res.isError()) {
    return res;
  }

  return toDatabases(rows, result);
}

Result ProtocolClient::verifyConnectivity (chrono::milliseconds timeout) {
  QueryResult rows;
  return query("RETURN 1 AS ok", timeout, rows);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
