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

#ifndef NEO4J_WORK_QUEUE_H
#define NEO4J_WORK_QUEUE_H 1

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                                  class WorkQueue
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief queue of resource keys
///
/// A key is contained at most once. A key which is handed out by get is not
/// handed out again before done was called for it; if it was added in the
/// meantime it is queued again by done.
////////////////////////////////////////////////////////////////////////////////

  class WorkQueue {
    WorkQueue (const WorkQueue&) = delete;
    WorkQueue& operator= (const WorkQueue&) = delete;

    public:

      typedef std::chrono::steady_clock::duration Duration;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      WorkQueue (Duration baseDelay = std::chrono::milliseconds(5),
                 Duration maxDelay = std::chrono::seconds(300));

      ~WorkQueue ();

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

      void add (const std::string& key);

////////////////////////////////////////////////////////////////////////////////
/// @brief adds a key once the delay has passed
////////////////////////////////////////////////////////////////////////////////

      void addAfter (const std::string& key, Duration delay);

////////////////////////////////////////////////////////////////////////////////
/// @brief adds a key after its exponential backoff, the backoff doubles with
/// every call until forget is called
////////////////////////////////////////////////////////////////////////////////

      void addRateLimited (const std::string& key);

      void forget (const std::string& key);

      int failures (const std::string& key);

////////////////////////////////////////////////////////////////////////////////
/// @brief waits for the next key, returns false once the queue is shut down
////////////////////////////////////////////////////////////////////////////////

      bool get (std::string& key);

      void done (const std::string& key);

      void shutDown ();

      bool shuttingDown ();

      size_t len ();

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      void insert (const std::string& key);

      void promoteWaiting (std::chrono::steady_clock::time_point now);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      const Duration _baseDelay;

      const Duration _maxDelay;

      std::mutex _lock;

      std::condition_variable _cond;

      bool _shutdown;

      std::deque<std::string> _queue;

////////////////////////////////////////////////////////////////////////////////
/// @brief keys which need processing
////////////////////////////////////////////////////////////////////////////////

      std::set<std::string> _dirty;

////////////////////////////////////////////////////////////////////////////////
/// @brief keys currently handed out
////////////////////////////////////////////////////////////////////////////////

      std::set<std::string> _processing;

////////////////////////////////////////////////////////////////////////////////
/// @brief delayed keys by due time
////////////////////////////////////////////////////////////////////////////////

      std::multimap<std::chrono::steady_clock::time_point, std::string> _waiting;

      std::unordered_map<std::string, int> _failures;
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
