////////////////////////////////////////////////////////////////////////////////
/// @brief circuit breaker for database connections
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

#ifndef NEO4J_CIRCUIT_BREAKER_H
#define NEO4J_CIRCUIT_BREAKER_H 1

#include "Result.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                             class CircuitBreaker
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief circuit breaker guarding the calls into one cluster
///
/// After maxFailures consecutive failures the breaker opens and rejects all
/// calls. Once resetTimeout has passed since the last failure it lets up to
/// halfOpenMaxCalls trial calls through. A successful trial closes the
/// breaker again, a failed trial reopens it.
////////////////////////////////////////////////////////////////////////////////

  class CircuitBreaker {
    CircuitBreaker (const CircuitBreaker&) = delete;
    CircuitBreaker& operator= (const CircuitBreaker&) = delete;

    public:

      enum class State {
        CLOSED,
        OPEN,
        HALF_OPEN
      };

      typedef std::function<std::chrono::steady_clock::time_point ()> Clock;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      CircuitBreaker (int maxFailures,
                      std::chrono::steady_clock::duration resetTimeout,
                      int halfOpenMaxCalls,
                      Clock clock = &std::chrono::steady_clock::now);

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief checks whether a call may pass, counts half-open trial calls
////////////////////////////////////////////////////////////////////////////////

      bool allow ();

      void recordSuccess ();

      void recordFailure ();

////////////////////////////////////////////////////////////////////////////////
/// @brief records the result of a call which passed allow()
///
/// Only transient errors and timeouts count as failures.
////////////////////////////////////////////////////////////////////////////////

      void record (const Result& res);

////////////////////////////////////////////////////////////////////////////////
/// @brief runs an operation through the breaker
///
/// Returns CIRCUIT_OPEN without calling the operation if the breaker rejects
/// it. Only transient errors and timeouts count as failures, a query error
/// reported by a reachable server does not open the breaker.
////////////////////////////////////////////////////////////////////////////////

      Result execute (const std::function<Result ()>& operation);

      State state ();

      int failures ();

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      const int _maxFailures;
      const std::chrono::steady_clock::duration _resetTimeout;
      const int _halfOpenMaxCalls;
      Clock _clock;

      std::mutex _lock;
      State _state;
      int _failures;
      int _halfOpenCalls;
      std::chrono::steady_clock::time_point _lastFailure;
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief name of a breaker state
////////////////////////////////////////////////////////////////////////////////

  std::string toString (CircuitBreaker::State);

// -----------------------------------------------------------------------------
// --SECTION--                                     class CircuitBreakerRegistry
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief one circuit breaker per cluster key
////////////////////////////////////////////////////////////////////////////////

  class CircuitBreakerRegistry {
    CircuitBreakerRegistry (const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator= (const CircuitBreakerRegistry&) = delete;

    public:

      CircuitBreakerRegistry (int maxFailures = 5,
                              std::chrono::steady_clock::duration resetTimeout
                                = std::chrono::seconds(30),
                              int halfOpenMaxCalls = 3);

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief returns the breaker of a cluster, creating it if necessary
////////////////////////////////////////////////////////////////////////////////

      std::shared_ptr<CircuitBreaker> get (const std::string& key);

////////////////////////////////////////////////////////////////////////////////
/// @brief forgets the breaker of a deleted cluster
////////////////////////////////////////////////////////////////////////////////

      void remove (const std::string& key);

      size_t size ();

    private:

      const int _maxFailures;
      const std::chrono::steady_clock::duration _resetTimeout;
      const int _halfOpenMaxCalls;

      std::mutex _lock;
      std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> _breakers;
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
