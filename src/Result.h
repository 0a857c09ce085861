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

#ifndef NEO4J_RESULT_H
#define NEO4J_RESULT_H 1

#include <string>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                                 enum ResultCode
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief error codes
////////////////////////////////////////////////////////////////////////////////

  enum class ResultCode {
    OK,
    CONFLICT,
    NOT_FOUND,
    UNAVAILABLE,
    TIMEOUT,
    INVALID,
    AUTH,
    QUERY,
    CIRCUIT_OPEN,
    INTERNAL
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief name of an error code
////////////////////////////////////////////////////////////////////////////////

  std::string toString (ResultCode);

// -----------------------------------------------------------------------------
// --SECTION--                                                     class Result
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief result of an operation, either no error or an error code together
/// with a human readable message
////////////////////////////////////////////////////////////////////////////////

  class Result {

// -----------------------------------------------------------------------------
// --SECTION--                                             static public methods
// -----------------------------------------------------------------------------

    public:

      static Result noError () {
        return Result(ResultCode::OK, "");
      }

      static Result error (ResultCode code, const std::string& message) {
        return Result(code, message);
      }

      static Result internalError () {
        return Result(ResultCode::INTERNAL, "internal error");
      }

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      Result ()
        : _code(ResultCode::OK) {
      }

    private:

      Result (ResultCode code, const std::string& message)
        : _code(code), _message(message) {
      }

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

      bool isError () const {
        return _code != ResultCode::OK;
      }

      ResultCode code () const {
        return _code;
      }

      const std::string& errorMessage () const {
        return _message;
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief true for errors which go away if the operation is retried later
////////////////////////////////////////////////////////////////////////////////

      bool isTransient () const;

////////////////////////////////////////////////////////////////////////////////
/// @brief code and message for logging
////////////////////////////////////////////////////////////////////////////////

      std::string toString () const;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      ResultCode _code;
      std::string _message;
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
