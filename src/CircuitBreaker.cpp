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

#include "CircuitBreaker.h"

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

string neo4j::toString (CircuitBreaker::State state) {
  switch (state) {
    case CircuitBreaker::State::CLOSED: return "closed";
    case CircuitBreaker::State::OPEN: return "open";
    case CircuitBreaker::State::HALF_OPEN: return "half-open";
  }

  return "unknown";
}

// -----------------------------------------------------------------------------
// --SECTION--                                             class CircuitBreaker
// -----------------------------------------------------------------------------

CircuitBreaker::CircuitBreaker (int maxFailures,
                                chrono::steady_clock::duration resetTimeout,
                                int halfOpenMaxCalls,
                                Clock clock)
  : _maxFailures(maxFailures),
    _resetTimeout(resetTimeout),
    _halfOpenMaxCalls(halfOpenMaxCalls),
    _clock(clock),
    _state(State::CLOSED),
    _failures(0),
    _halfOpenCalls(0) {
}

////////////////////////////////////////////////////////////////////////////////
/// @brief checks whether a call may pass
////////////////////////////////////////////////////////////////////////////////

bool CircuitBreaker::allow () {
  lock_guard<mutex> lock(_lock);

  switch (_state) {
    case State::CLOSED:
      return true;

    case State::OPEN:
      if (_clock() - _lastFailure < _resetTimeout) {
        return false;
      }

      _state = State::HALF_OPEN;
      _halfOpenCalls = 1;
      return true;

    case State::HALF_OPEN:
      if (_halfOpenCalls >= _halfOpenMaxCalls) {
        return false;
      }

      ++_halfOpenCalls;
      return true;
  }

  return false;
}

void CircuitBreaker::recordSuccess () {
  lock_guard<mutex> lock(_lock);

  _failures = 0;

  if (_state != State::CLOSED) {
    _state = State::CLOSED;
    _halfOpenCalls = 0;
  }
}

void CircuitBreaker::recordFailure () {
  lock_guard<mutex> lock(_lock);

  ++_failures;
  _lastFailure = _clock();

  if (_state == State::HALF_OPEN || _failures >= _maxFailures) {
    if (_state != State::OPEN) {
      LOG(WARNING)
      << "circuit breaker opened after " << _failures << " failure(s)";
    }

    _state = State::OPEN;
    _halfOpenCalls = 0;
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief records the result of a call which passed allow()
////////////////////////////////////////////////////////////////////////////////

void CircuitBreaker::record (const Result& res) {
  if (res.isError() && res.isTransient()) {
    recordFailure();
  }
  else {
    recordSuccess();
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief runs an operation through the breaker
////////////////////////////////////////////////////////////////////////////////

Result CircuitBreaker::execute (const function<Result ()>& operation) {
  if (! allow()) {
    return Result::error(ResultCode::CIRCUIT_OPEN,
                         "circuit breaker is open, operation rejected");
  }

  Result res = operation();
  record(res);

  return res;
}

CircuitBreaker::State CircuitBreaker::state () {
  lock_guard<mutex> lock(_lock);
  return _state;
}

int CircuitBreaker::failures () {
  lock_guard<mutex> lock(_lock);
  return _failures;
}

// -----------------------------------------------------------------------------
// --SECTION--                                     class CircuitBreakerRegistry
// -----------------------------------------------------------------------------

CircuitBreakerRegistry::CircuitBreakerRegistry (
  int maxFailures,
  chrono::steady_clock::duration resetTimeout,
  int halfOpenMaxCalls)
  : _maxFailures(maxFailures),
    _resetTimeout(resetTimeout),
    _halfOpenMaxCalls(halfOpenMaxCalls) {
}

////////////////////////////////////////////////////////////////////////////////
/// @brief returns the breaker of a cluster, creating it if necessary
////////////////////////////////////////////////////////////////////////////////

shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get (const string& key) {
  lock_guard<mutex> lock(_lock);

  auto& breaker = _breakers[key];

  if (breaker == nullptr) {
    breaker.reset(new CircuitBreaker(_maxFailures, _resetTimeout,
                                     _halfOpenMaxCalls));
  }

  return breaker;
}

void CircuitBreakerRegistry::remove (const string& key) {
  lock_guard<mutex> lock(_lock);
  _breakers.erase(key);
}

size_t CircuitBreakerRegistry::size () {
  lock_guard<mutex> lock(_lock);
  return _breakers.size();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
