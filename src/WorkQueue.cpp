////////////////////////////////////////////////////////////////////////////////
/// @brief deduplicating work queue
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

#include "WorkQueue.h"

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

WorkQueue::WorkQueue (Duration baseDelay, Duration maxDelay)
  : _baseDelay(baseDelay),
    _maxDelay(maxDelay),
    _shutdown(false) {
}

WorkQueue::~WorkQueue () {
  shutDown();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

void WorkQueue::add (const string& key) {
  lock_guard<mutex> lock(_lock);
  insert(key);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief adds a key once the delay has passed
////////////////////////////////////////////////////////////////////////////////

void WorkQueue::addAfter (const string& key, Duration delay) {
  if (delay <= Duration::zero()) {
    add(key);
    return;
  }

  lock_guard<mutex> lock(_lock);

  if (_shutdown) {
    return;
  }

  auto due = chrono::steady_clock::now() + delay;

  for (auto iter = _waiting.begin(); iter != _waiting.end(); ++iter) {
    if (iter->second == key) {
      if (iter->first <= due) {
        return;
      }

      _waiting.erase(iter);
      break;
    }
  }

  _waiting.insert(make_pair(due, key));
  _cond.notify_all();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief adds a key after its exponential backoff
////////////////////////////////////////////////////////////////////////////////

void WorkQueue::addRateLimited (const string& key) {
  Duration delay = _baseDelay;

  {
    lock_guard<mutex> lock(_lock);
    int n = _failures[key]++;

    for (int i = 0; i < n && delay < _maxDelay; ++i) {
      delay *= 2;
    }

    if (delay > _maxDelay) {
      delay = _maxDelay;
    }
  }

  addAfter(key, delay);
}

void WorkQueue::forget (const string& key) {
  lock_guard<mutex> lock(_lock);
  _failures.erase(key);
}

int WorkQueue::failures (const string& key) {
  lock_guard<mutex> lock(_lock);
  auto iter = _failures.find(key);
  return iter == _failures.end() ? 0 : iter->second;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief waits for the next key
////////////////////////////////////////////////////////////////////////////////

bool WorkQueue::get (string& key) {
  unique_lock<mutex> lock(_lock);

  while (true) {
    if (_shutdown) {
      return false;
    }

    promoteWaiting(chrono::steady_clock::now());

    if (! _queue.empty()) {
      key = _queue.front();
      _queue.pop_front();
      _dirty.erase(key);
      _processing.insert(key);
      return true;
    }

    if (_waiting.empty()) {
      _cond.wait(lock);
    }
    else {
      _cond.wait_until(lock, _waiting.begin()->first);
    }
  }
}

void WorkQueue::done (const string& key) {
  lock_guard<mutex> lock(_lock);

  _processing.erase(key);

  if (_dirty.find(key) != _dirty.end()) {
    _queue.push_back(key);
    _cond.notify_one();
  }
}

void WorkQueue::shutDown () {
  lock_guard<mutex> lock(_lock);
  _shutdown = true;
  _cond.notify_all();
}

bool WorkQueue::shuttingDown () {
  lock_guard<mutex> lock(_lock);
  return _shutdown;
}

size_t WorkQueue::len () {
  lock_guard<mutex> lock(_lock);
  return _queue.size();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

void WorkQueue::insert (const string& key) {
  if (_shutdown) {
    return;
  }

  if (_dirty.find(key) != _dirty.end()) {
    return;
  }

  _dirty.insert(key);

  if (_processing.find(key) != _processing.end()) {
    return;
  }

  _queue.push_back(key);
  _cond.notify_one();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief moves the due delayed keys into the queue
////////////////////////////////////////////////////////////////////////////////

void WorkQueue::promoteWaiting (chrono::steady_clock::time_point now) {
  while (! _waiting.empty() && _waiting.begin()->first <= now) {
    string key = _waiting.begin()->second;
    _waiting.erase(_waiting.begin());
    insert(key);
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
