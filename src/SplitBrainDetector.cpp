////////////////////////////////////////////////////////////////////////////////
/// @brief split-brain detection
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

#include "SplitBrainDetector.h"

#include "ResourceBuilder.h"
#include "utils.h"

#include <algorithm>
#include <map>
#include <set>
#include <thread>

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief host part of "host:port"
////////////////////////////////////////////////////////////////////////////////

static string hostOf (const string& address) {
  string::size_type n = address.rfind(':');

  if (n == string::npos) {
    return address;
  }

  return address.substr(0, n);
}

static bool startsWith (const string& text, const string& prefix) {
  return text.size() >= prefix.size()
      && text.compare(0, prefix.size(), prefix) == 0;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief checks if a server entry denotes a member
////////////////////////////////////////////////////////////////////////////////

static bool matches (const ServerDiagnostic& server, const Member& member) {
  string host = hostOf(server.address());

  if (! host.empty()) {
    if (host == member.host()
        || startsWith(member.host(), host + ".")
        || startsWith(host, member.host() + ".")
        || host == member.name()
        || startsWith(host, member.name() + ".")) {
      return true;
    }
  }

  return server.name() == member.name();
}

static string names (const vector<Member>& members) {
  vector<string> n;

  for (const auto& m : members) {
    n.push_back(m.name());
  }

  return join(n, ", ");
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

string neo4j::toString (SplitBrainVerdict verdict) {
  switch (verdict) {
    case SplitBrainVerdict::HEALTHY: return "healthy";
    case SplitBrainVerdict::SPLIT: return "split";
    case SplitBrainVerdict::UNKNOWN: return "unknown";
  }

  return "unknown";
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

SplitBrainDetector::SplitBrainDetector (ProtocolClientFactory& factory,
                                        Platform& platform,
                                        OperatorMetrics& metrics,
                                        chrono::milliseconds probeTimeout)
  : _factory(factory),
    _platform(platform),
    _metrics(metrics),
    _probeTimeout(probeTimeout) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief probes all members concurrently and evaluates their views
////////////////////////////////////////////////////////////////////////////////

SplitBrainResult SplitBrainDetector::detect (const ClusterResource& cluster,
                                             const vector<Member>& members) {
  string key = clusterKey(cluster.ns(), cluster.name());
  int expected = expectedServers(cluster.spec());

  if (expected <= 1) {
    SplitBrainResult result;
    result.verdict = SplitBrainVerdict::HEALTHY;
    result.majority = members;
    result.message = "single server cluster cannot split";
    return result;
  }

  vector<MemberView> views(members.size());
  vector<thread> probes;

  for (size_t i = 0; i < members.size(); ++i) {
    probes.emplace_back([this, i, &members, &views] () {
      views[i] = probe(members[i], members);
    });
  }

  for (auto& p : probes) {
    p.join();
  }

  SplitBrainResult result = evaluate(views, expected);

  if (result.verdict == SplitBrainVerdict::SPLIT) {
    _metrics.splitBrainDetected->inc({ cluster.name(), cluster.ns() });

    LOG(WARNING)
    << "SPLIT-BRAIN detected in " << key << ": majority [" << names(result.majority)
    << "], minority [" << names(result.minority) << "]";

    publishEvent(_platform, cluster, EVENT_WARNING, EVENT_SPLIT_BRAIN_DETECTED,
                 result.message);
  }
  else if (result.verdict == SplitBrainVerdict::UNKNOWN) {
    LOG(INFO)
    << "split-brain check of " << key << " inconclusive: " << result.message;
  }

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief restarts the minority members
////////////////////////////////////////////////////////////////////////////////

int SplitBrainDetector::repair (const ClusterResource& cluster,
                                const SplitBrainResult& result) {
  if (result.verdict != SplitBrainVerdict::SPLIT) {
    return 0;
  }

  int deleted = 0;
  vector<Member> failed;

  for (const auto& member : result.minority) {
    LOG(WARNING)
    << "SPLIT-BRAIN repair: restarting " << cluster.ns() << "/" << member.name();

    Result res = _platform.deletePod(cluster.ns(), member.name());

    if (res.isError()) {
      LOG(ERROR)
      << "cannot restart " << cluster.ns() << "/" << member.name()
      << ", will retry in the next detection cycle: " << res.toString();
      failed.push_back(member);
      continue;
    }

    ++deleted;
  }

  if (failed.empty()) {
    publishEvent(_platform, cluster, EVENT_NORMAL, EVENT_SPLIT_BRAIN_REPAIRED,
                 "restarted minority members " + names(result.minority));
  }
  else {
    publishEvent(_platform, cluster, EVENT_WARNING, EVENT_SPLIT_BRAIN_REPAIR_FAILED,
                 "cannot restart minority members " + names(failed));
  }

  return deleted;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief groups the views
////////////////////////////////////////////////////////////////////////////////

SplitBrainResult SplitBrainDetector::evaluate (const vector<MemberView>& views,
                                               int expected) {
  SplitBrainResult result;

  map<string, size_t> index;
  vector<size_t> reachable;

  for (size_t i = 0; i < views.size(); ++i) {
    if (views[i].reachable) {
      index[views[i].member.name()] = i;
      reachable.push_back(i);
    }
    else {
      result.unreachable.push_back(views[i].member);
    }
  }

  if (expected <= 1) {
    result.verdict = SplitBrainVerdict::HEALTHY;
    result.message = "single server cluster cannot split";

    for (size_t i : reachable) {
      result.majority.push_back(views[i].member);
    }

    return result;
  }

  if (reachable.size() * 2 <= (size_t) expected) {
    result.verdict = SplitBrainVerdict::UNKNOWN;
    result.message = "only " + to_string(reachable.size()) + " of "
                   + to_string(expected) + " members answered";
    return result;
  }

  // mutual visibility
  map<size_t, set<size_t>> sees;

  for (size_t i : reachable) {
    for (const auto& name : views[i].sees) {
      auto iter = index.find(name);

      if (iter != index.end()) {
        sees[i].insert(iter->second);
      }
    }
  }

  vector<int> group(views.size(), -1);
  vector<vector<size_t>> groups;

  for (size_t start : reachable) {
    if (group[start] != -1) {
      continue;
    }

    int g = (int) groups.size();
    groups.push_back(vector<size_t>());

    vector<size_t> todo;
    todo.push_back(start);
    group[start] = g;

    while (! todo.empty()) {
      size_t i = todo.back();
      todo.pop_back();
      groups[g].push_back(i);

      for (size_t j : sees[i]) {
        if (group[j] == -1 && sees[j].count(i) > 0) {
          group[j] = g;
          todo.push_back(j);
        }
      }
    }
  }

  stable_sort(groups.begin(), groups.end(),
              [] (const vector<size_t>& a, const vector<size_t>& b) {
                return a.size() > b.size();
              });

  if (groups.size() == 1) {
    result.verdict = SplitBrainVerdict::HEALTHY;
    result.message = "all " + to_string(reachable.size())
                   + " reachable members agree on the membership";

    for (size_t i : groups[0]) {
      result.majority.push_back(views[i].member);
    }

    return result;
  }

  if (groups[0].size() == groups[1].size()) {
    result.verdict = SplitBrainVerdict::UNKNOWN;
    result.message = to_string(groups.size()) + " groups found, but no group "
                   + "has a strict majority";
    return result;
  }

  result.verdict = SplitBrainVerdict::SPLIT;

  for (size_t g = 0; g < groups.size(); ++g) {
    for (size_t i : groups[g]) {
      if (g == 0) {
        result.majority.push_back(views[i].member);
      }
      else {
        result.minority.push_back(views[i].member);
      }
    }
  }

  result.message = to_string(groups.size()) + " groups found, "
                 + to_string(result.minority.size())
                 + " member(s) outside the majority: " + names(result.minority);

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief names of the members matching the enabled and available servers
////////////////////////////////////////////////////////////////////////////////

vector<string> SplitBrainDetector::visibleMembers (
  const vector<ServerDiagnostic>& servers,
  const vector<Member>& members) {

  vector<string> result;

  for (const auto& server : servers) {
    if (server.state() != "Enabled" || server.health() != "Available") {
      continue;
    }

    for (const auto& member : members) {
      if (matches(server, member)) {
        result.push_back(member.name());
        break;
      }
    }
  }

  return result;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief asks one member for its view, connecting to its own address
////////////////////////////////////////////////////////////////////////////////

MemberView SplitBrainDetector::probe (const Member& member,
                                      const vector<Member>& members) {
  MemberView view;
  view.member = member;

  unique_ptr<ProtocolClient> client;
  Result res = _factory.create(member.host(), client);

  if (res.isError()) {
    view.error = res.toString();
    return view;
  }

  vector<ServerDiagnostic> servers;
  res = client->listServers(_probeTimeout, servers);
  client->close();

  if (res.isError()) {
    LOG(INFO)
    << "member " << member.name() << " did not answer: " << res.toString();
    view.error = res.toString();
    return view;
  }

  view.reachable = true;
  view.sees = visibleMembers(servers, members);

  return view;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
