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

#ifndef NEO4J_SPLIT_BRAIN_DETECTOR_H
#define NEO4J_SPLIT_BRAIN_DETECTOR_H 1

#include "MetricsRegistry.h"
#include "Platform.h"
#include "ProtocolClient.h"
#include "neo4j.pb.h"

#include <chrono>
#include <string>
#include <vector>

namespace neo4j {

  enum class SplitBrainVerdict {
    HEALTHY,
    SPLIT,
    UNKNOWN
  };

  std::string toString (SplitBrainVerdict);

////////////////////////////////////////////////////////////////////////////////
/// @brief the membership view of one member
////////////////////////////////////////////////////////////////////////////////

  struct MemberView {
    MemberView ()
      : reachable(false) {
    }

    Member member;
    bool reachable;
    std::string error;

////////////////////////////////////////////////////////////////////////////////
/// @brief names of the known members this member considers enabled and
/// available
////////////////////////////////////////////////////////////////////////////////

    std::vector<std::string> sees;
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief outcome of a detection
////////////////////////////////////////////////////////////////////////////////

  struct SplitBrainResult {
    SplitBrainResult ()
      : verdict(SplitBrainVerdict::UNKNOWN) {
    }

    bool healthy () const {
      return verdict == SplitBrainVerdict::HEALTHY;
    }

    SplitBrainVerdict verdict;
    std::vector<Member> majority;
    std::vector<Member> minority;
    std::vector<Member> unreachable;
    std::string message;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                         class SplitBrainDetector
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief detects members which disagree about the cluster membership
///
/// Every member is asked directly for its view of the cluster. Members which
/// see each other form a group. Only if one group is strictly larger than
/// every other one the remaining groups are reported as minority. Without
/// answers from a majority of the expected members nothing is concluded.
////////////////////////////////////////////////////////////////////////////////

  class SplitBrainDetector {
    SplitBrainDetector (const SplitBrainDetector&) = delete;
    SplitBrainDetector& operator= (const SplitBrainDetector&) = delete;

    public:

      SplitBrainDetector (ProtocolClientFactory& factory,
                          Platform& platform,
                          OperatorMetrics& metrics,
                          std::chrono::milliseconds probeTimeout);

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief probes all members concurrently and evaluates their views
////////////////////////////////////////////////////////////////////////////////

      SplitBrainResult detect (const ClusterResource& cluster,
                               const std::vector<Member>& members);

////////////////////////////////////////////////////////////////////////////////
/// @brief restarts the minority members, returns the number of deleted pods
///
/// Failures are logged and left to the next detection cycle.
////////////////////////////////////////////////////////////////////////////////

      int repair (const ClusterResource& cluster, const SplitBrainResult&);

////////////////////////////////////////////////////////////////////////////////
/// @brief groups the views, expected is the desired number of members
////////////////////////////////////////////////////////////////////////////////

      static SplitBrainResult evaluate (const std::vector<MemberView>& views,
                                        int expected);

////////////////////////////////////////////////////////////////////////////////
/// @brief names of the members matching the enabled and available servers
////////////////////////////////////////////////////////////////////////////////

      static std::vector<std::string> visibleMembers (
        const std::vector<ServerDiagnostic>& servers,
        const std::vector<Member>& members);

    private:

      MemberView probe (const Member& member,
                        const std::vector<Member>& members);

    private:

      ProtocolClientFactory& _factory;

      Platform& _platform;

      OperatorMetrics& _metrics;

      const std::chrono::milliseconds _probeTimeout;
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
