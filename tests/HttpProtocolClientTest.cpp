////////////////////////////////////////////////////////////////////////////////
/// @brief tests for the transaction endpoint client
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

#include <gtest/gtest.h>

using namespace neo4j;
using namespace std;

TEST(HttpProtocolClient, ParsesRows) {
  QueryResult result;
  Result res = HttpProtocolClient::parseResponse(
    "{\"results\":[{\"columns\":[\"name\",\"address\",\"state\",\"health\",\"hosting\"],"
    "\"data\":[{\"row\":[\"s0\",\"a:7687\",\"Enabled\",\"Available\",[\"neo4j\",\"system\"]],\"meta\":[]},"
    "{\"row\":[\"s1\",\"b:7687\",\"Enabled\",\"Unavailable\",[]],\"meta\":[]}]}],"
    "\"errors\":[]}",
    result);

  ASSERT_FALSE(res.isError());
  EXPECT_EQ(5u, result.columns.size());
  EXPECT_EQ(2u, result.rows.size());
  EXPECT_EQ(3, result.column("health"));
  EXPECT_EQ(-1, result.column("missing"));

  vector<ServerDiagnostic> servers;
  ASSERT_FALSE(toServers(result, servers).isError());
  ASSERT_EQ(2u, servers.size());
  EXPECT_EQ("s0", servers[0].name());
  EXPECT_EQ("a:7687", servers[0].address());
  EXPECT_EQ(2, servers[0].hosting_count());
  EXPECT_EQ("Unavailable", servers[1].health());
  EXPECT_EQ(0, servers[1].hosting_count());
}

TEST(HttpProtocolClient, SecurityErrorsAreAuthErrors) {
  QueryResult result;
  Result res = HttpProtocolClient::parseResponse(
    "{\"results\":[],\"errors\":[{\"code\":\"Neo.ClientError.Security.Unauthorized\","
    "\"message\":\"The client is unauthorized\"}]}",
    result);

  EXPECT_EQ(ResultCode::AUTH, res.code());
  EXPECT_FALSE(res.isTransient());
}

TEST(HttpProtocolClient, StatementErrorsAreQueryErrors) {
  QueryResult result;
  Result res = HttpProtocolClient::parseResponse(
    "{\"results\":[],\"errors\":[{\"code\":\"Neo.ClientError.Statement.SyntaxError\","
    "\"message\":\"Invalid input\"}]}",
    result);

  EXPECT_EQ(ResultCode::QUERY, res.code());
  EXPECT_EQ("Neo.ClientError.Statement.SyntaxError: Invalid input", res.errorMessage());
}

TEST(HttpProtocolClient, MalformedResponses) {
  QueryResult result;

  EXPECT_EQ(ResultCode::QUERY, HttpProtocolClient::parseResponse("{", result).code());
  EXPECT_EQ(ResultCode::QUERY, HttpProtocolClient::parseResponse("[]", result).code());
  EXPECT_EQ(ResultCode::QUERY,
            HttpProtocolClient::parseResponse("{\"results\":[]}", result).code());
  EXPECT_EQ(ResultCode::QUERY,
            HttpProtocolClient::parseResponse("{\"errors\":[\"boom\"]}", result).code());
}

TEST(HttpProtocolClient, DatabasesKeepFirstRowPerName) {
  QueryResult rows;
  rows.columns = {"name", "currentStatus", "requestedStatus", "role", "default"};

  auto row = [] (const string& name, const string& status, const string& role, bool def) {
    vector<picojson::value> r;
    r.push_back(picojson::value(name));
    r.push_back(picojson::value(status));
    r.push_back(picojson::value(string("online")));
    r.push_back(picojson::value(role));
    r.push_back(picojson::value(def));
    return r;
  };

  rows.rows.push_back(row("neo4j", "online", "primary", true));
  rows.rows.push_back(row("neo4j", "starting", "secondary", true));
  rows.rows.push_back(row("system", "online", "primary", false));

  vector<DatabaseDiagnostic> databases;
  ASSERT_FALSE(toDatabases(rows, databases).isError());
  ASSERT_EQ(2u, databases.size());
  EXPECT_EQ("neo4j", databases[0].name());
  EXPECT_EQ("online", databases[0].status());
  EXPECT_EQ("primary", databases[0].role());
  EXPECT_TRUE(databases[0].is_default());
  EXPECT_FALSE(databases[1].is_default());
}

TEST(HttpProtocolClient, MissingNameColumn) {
  QueryResult rows;
  rows.columns = {"address"};

  vector<ServerDiagnostic> servers;
  EXPECT_EQ(ResultCode::QUERY, toServers(rows, servers).code());

  vector<DatabaseDiagnostic> databases;
  EXPECT_EQ(ResultCode::QUERY, toDatabases(rows, databases).code());
}

TEST(HttpProtocolClient, QueryWithoutConnect) {
  HttpProtocolClient client("graph-client.prod.svc.cluster.local", 7474, false, "");
  QueryResult result;

  Result res = client.query("RETURN 1", chrono::seconds(1), result);
  EXPECT_EQ(ResultCode::UNAVAILABLE, res.code());
  EXPECT_EQ("graph-client.prod.svc.cluster.local", client.host());
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
