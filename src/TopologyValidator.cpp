////////////////////////////////////////////////////////////////////////////////
/// @brief topology validation
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

#include "TopologyValidator.h"

#include <boost/regex.hpp>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief longest suffix appended to the cluster name by the resource builder
////////////////////////////////////////////////////////////////////////////////

static const string LongestSuffix = "-headless";

static bool isDnsLabel (const string& name) {
  static const boost::regex label("[a-z0-9]([-a-z0-9]*[a-z0-9])?");

  return name.size() + LongestSuffix.size() <= 63
      && boost::regex_match(name, label);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

string neo4j::toString (ScaleTransition transition) {
  switch (transition) {
    case ScaleTransition::NONE: return "none";
    case ScaleTransition::SINGLE_TO_MULTI: return "single-to-multi";
  }

  return "unknown";
}

// -----------------------------------------------------------------------------
// --SECTION--                                          class TopologyValidator
// -----------------------------------------------------------------------------

TopologyValidator::TopologyValidator (int maxServers)
  : _maxServers(maxServers) {
}

////////////////////////////////////////////////////////////////////////////////
/// @brief validates the desired topology of a cluster
////////////////////////////////////////////////////////////////////////////////

ValidationResult TopologyValidator::validate (
  const ClusterResource& cluster,
  const Option<int32_t>& previousPrimaries) const {

  ValidationResult result;
  const Topology& topology = cluster.spec().topology();
  int32_t primaries = topology.primaries();
  int32_t secondaries = topology.secondaries();

  if (! isDnsLabel(cluster.name())) {
    result.errors.push_back(
      "name '" + cluster.name() + "' cannot be used for derived objects, "
      "it must be a DNS label of at most "
      + to_string(63 - LongestSuffix.size()) + " characters");
  }

  if (primaries < 1) {
    result.errors.push_back(
      "spec.topology.primaries must be at least 1, got "
      + to_string(primaries));
  }

  if (secondaries < 0) {
    result.errors.push_back(
      "spec.topology.secondaries cannot be negative, got "
      + to_string(secondaries));
  }

  int64_t total = (int64_t) primaries + (int64_t) secondaries;

  if (topology.servers() > total) {
    total = topology.servers();
  }

  if (total > _maxServers) {
    result.errors.push_back(
      "cluster requests " + to_string(total) + " servers, the limit is "
      + to_string(_maxServers));
  }

  if (! result.errors.empty()) {
    result.ok = false;
    return result;
  }

  if (primaries % 2 == 0) {
    result.warnings.push_back(
      "Even number of primary nodes (" + to_string(primaries) + ") "
      "reduces fault tolerance. In a split-brain scenario, the cluster may "
      "become unavailable. Consider using an odd number (3, 5, or 7).");
  }

  if (primaries == 2) {
    result.warnings.push_back(
      "2 primary nodes provide limited fault tolerance. If one node fails, "
      "the remaining node cannot form quorum. Consider using 3 primary "
      "nodes for production deployments.");
  }

  if (previousPrimaries.isSome()
      && previousPrimaries.get() == 1
      && primaries > 1) {
    result.transition = ScaleTransition::SINGLE_TO_MULTI;
  }

  return result;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
