////////////////////////////////////////////////////////////////////////////////
/// @brief convergence of child objects
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

#ifndef NEO4J_CONVERGENCE_ENGINE_H
#define NEO4J_CONVERGENCE_ENGINE_H 1

#include "Platform.h"
#include "Result.h"
#include "TopologyValidator.h"
#include "neo4j.pb.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace neo4j {

////////////////////////////////////////////////////////////////////////////////
/// @brief reference to a child object
////////////////////////////////////////////////////////////////////////////////

  struct ObjectRef {
    ObjectRef () {
    }

    explicit ObjectRef (const ChildObject& child)
      : kind(child.kind()), ns(child.ns()), name(child.name()) {
    }

    std::string toString () const {
      return kind + " " + ns + "/" + name;
    }

    bool operator== (const ObjectRef& other) const {
      return kind == other.kind && ns == other.ns && name == other.name;
    }

    std::string kind;
    std::string ns;
    std::string name;
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief outcome of a convergence pass
///
/// deferred lists the changes held back by the debounce window, they are
/// contained in skipped as well. recheckAfter is the time until the earliest
/// deferred change becomes due, zero if nothing is deferred.
////////////////////////////////////////////////////////////////////////////////

  struct ConvergeResult {
    ConvergeResult ()
      : restartScheduled(false),
        recheckAfter(std::chrono::steady_clock::duration::zero()) {
    }

    std::vector<ObjectRef> applied;
    std::vector<ObjectRef> skipped;
    std::vector<ObjectRef> deferred;
    bool restartScheduled;
    std::chrono::steady_clock::duration recheckAfter;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                          class ConvergenceEngine
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief drives the live child objects towards the desired ones
///
/// Every applied object carries the content hash of its desired state in
/// the annotation neo4j.com/applied-hash. An object whose recorded hash
/// equals the desired hash is never written.
///
/// Changes to ConfigMaps are debounced: a new content must stay unchanged
/// for the debounce window before it is applied, a content which returns
/// to the applied one within the window is dropped. Applying a ConfigMap
/// update restarts the servers by stamping the pod template of the
/// StatefulSet.
////////////////////////////////////////////////////////////////////////////////

  class ConvergenceEngine {
    ConvergenceEngine (const ConvergenceEngine&) = delete;
    ConvergenceEngine& operator= (const ConvergenceEngine&) = delete;

    public:

      typedef std::function<std::chrono::steady_clock::time_point ()> Clock;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      ConvergenceEngine (Platform& platform,
                         std::chrono::steady_clock::duration debounce,
                         Clock clock = &std::chrono::steady_clock::now);

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief converges the live objects of one cluster
///
/// With the single-to-multi transition the debounce is bypassed and the
/// existing servers are restarted with the new bootstrap configuration.
////////////////////////////////////////////////////////////////////////////////

      Result converge (const std::vector<ChildObject>& desired,
                       const std::vector<ChildObject>& live,
                       ScaleTransition transition,
                       ConvergeResult& result);

////////////////////////////////////////////////////////////////////////////////
/// @brief drops the pending changes of a deleted cluster
////////////////////////////////////////////////////////////////////////////////

      void forget (const std::string& clusterKey);

      size_t pendingChanges ();

////////////////////////////////////////////////////////////////////////////////
/// @brief hash of the semantically relevant fields of an object
////////////////////////////////////////////////////////////////////////////////

      static std::string contentHash (const ChildObject&);

////////////////////////////////////////////////////////////////////////////////
/// @brief stamps the restart annotations into the pod template
////////////////////////////////////////////////////////////////////////////////

      static Result stampRestart (ChildObject& statefulSet,
                                  const std::string& configHash,
                                  const std::string& now);

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

    private:

      bool debounced (const ChildObject& desired,
                      const std::string& hash,
                      std::chrono::steady_clock::duration& wait);

      void dropPending (const std::string& key, bool reverted);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      struct PendingChange {
        std::string hash;
        std::string cluster;
        std::chrono::steady_clock::time_point since;
      };

      Platform& _platform;

      const std::chrono::steady_clock::duration _debounce;

      Clock _clock;

////////////////////////////////////////////////////////////////////////////////
/// @brief protects _pending
////////////////////////////////////////////////////////////////////////////////

      std::mutex _lock;

////////////////////////////////////////////////////////////////////////////////
/// @brief debounced changes by object
////////////////////////////////////////////////////////////////////////////////

      std::unordered_map<std::string, PendingChange> _pending;
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
