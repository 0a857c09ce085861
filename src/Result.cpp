////////////////////////////////////////////////////////////////////////////////
/// @brief result of an operation
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

#include "Result.h"

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief name of an error code
////////////////////////////////////////////////////////////////////////////////

string neo4j::toString (ResultCode code) {
  switch (code) {
    case ResultCode::OK: return "OK";
    case ResultCode::CONFLICT: return "CONFLICT";
    case ResultCode::NOT_FOUND: return "NOT_FOUND";
    case ResultCode::UNAVAILABLE: return "UNAVAILABLE";
    case ResultCode::TIMEOUT: return "TIMEOUT";
    case ResultCode::INVALID: return "INVALID";
    case ResultCode::AUTH: return "AUTH";
    case ResultCode::QUERY: return "QUERY";
    case ResultCode::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
    case ResultCode::INTERNAL: return "INTERNAL";
  }

  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief true for errors which go away if the operation is retried later
////////////////////////////////////////////////////////////////////////////////

bool Result::isTransient () const {
  switch (_code) {
    case ResultCode::CONFLICT:
    case ResultCode::UNAVAILABLE:
    case ResultCode::TIMEOUT:
    case ResultCode::CIRCUIT_OPEN:
      return true;

    case ResultCode::OK:
    case ResultCode::NOT_FOUND:
    case ResultCode::INVALID:
    case ResultCode::AUTH:
    case ResultCode::QUERY:
    case ResultCode::INTERNAL:
      return false;
  }

  return false;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief code and message for logging
////////////////////////////////////////////////////////////////////////////////

string Result::toString () const {
  if (! isError()) {
    return "OK";
  }

  return neo4j::toString(_code) + ": " + _message;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
