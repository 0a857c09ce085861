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

#ifndef NEO4J_TOPOLOGY_VALIDATOR_H
#define NEO4J_TOPOLOGY_VALIDATOR_H 1

#include "neo4j.pb.h"

#include <string>
#include <vector>

#include <stout/option.hpp>

namespace neo4j {

////////////////////////////////////////////////////////////////////////////////
/// @brief scaling transitions which need more than adding members
////////////////////////////////////////////////////////////////////////////////

  enum class ScaleTransition {
    NONE,
    SINGLE_TO_MULTI
  };

  std::string toString (ScaleTransition);

////////////////////////////////////////////////////////////////////////////////
/// @brief outcome of a validation
////////////////////////////////////////////////////////////////////////////////

  struct ValidationResult {
    ValidationResult ()
      : ok(true), transition(ScaleTransition::NONE) {
    }

    bool ok;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    ScaleTransition transition;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                          class TopologyValidator
// -----------------------------------------------------------------------------

  class TopologyValidator {
    public:

      explicit TopologyValidator (int maxServers);

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief validates the desired topology of a cluster
///
/// previousPrimaries is the primary count that was last applied, if any.
////////////////////////////////////////////////////////////////////////////////

      ValidationResult validate (const ClusterResource& cluster,
                                 const Option<int32_t>& previousPrimaries) const;

      int maxServers () const {
        return _maxServers;
      }

    private:

      const int _maxServers;
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
