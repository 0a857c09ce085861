////////////////////////////////////////////////////////////////////////////////
/// @brief in-memory platform for tests
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

#ifndef NEO4J_FAKE_PLATFORM_H
#define NEO4J_FAKE_PLATFORM_H 1

#include "Platform.h"
#include "ResourceBuilder.h"
#include "utils.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                                 struct FakeEvent
// -----------------------------------------------------------------------------

  struct FakeEvent {
    std::string key;
    std::string type;
    std::string reason;
    std::string message;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                               class FakePlatform
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief keeps clusters, children and members in memory
///
/// Every write bumps the resourceVersion of the object. A write carrying an
/// outdated resourceVersion fails with CONFLICT, as on the real api server.
////////////////////////////////////////////////////////////////////////////////

  class FakePlatform : public Platform {
    public:

      FakePlatform ()
        : creates(0),
          updates(0),
          statusWrites(0),
          statusConflicts(0),
          _version(0),
          _injectedConflicts(0) {
      }

// -----------------------------------------------------------------------------
// --SECTION--                                                       test setup
// -----------------------------------------------------------------------------

    public:

      void addCluster (const ClusterResource& cluster) {
        std::lock_guard<std::mutex> lock(_lock);

        ClusterResource c(cluster);
        c.set_resource_version(nextVersion());

        if (c.uid().empty()) {
          c.set_uid("uid-" + c.name());
        }

        _clusters[clusterKey(c.ns(), c.name())] = c;
      }

      void removeCluster (const std::string& key) {
        std::lock_guard<std::mutex> lock(_lock);
        _clusters.erase(key);
      }

      ClusterResource cluster (const std::string& key) {
        std::lock_guard<std::mutex> lock(_lock);
        return _clusters[key];
      }

      void setMembers (const ClusterResource& cluster,
                       const std::vector<Member>& members) {
        std::lock_guard<std::mutex> lock(_lock);
        _members[clusterKey(cluster.ns(), cluster.name())] = members;
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief the next n status writes fail as if another writer came first
////////////////////////////////////////////////////////////////////////////////

      void injectStatusConflicts (int n) {
        std::lock_guard<std::mutex> lock(_lock);
        _injectedConflicts = n;
      }

      void failChildWrites (const Result& error) {
        std::lock_guard<std::mutex> lock(_lock);
        _childError = error;
      }

      void failMembers (const Result& error) {
        std::lock_guard<std::mutex> lock(_lock);
        _membersError = error;
      }

      void failDeletes (const Result& error) {
        std::lock_guard<std::mutex> lock(_lock);
        _deleteError = error;
      }

      std::vector<ChildObject> children () {
        std::lock_guard<std::mutex> lock(_lock);
        std::vector<ChildObject> result;

        for (const auto& it : _children) {
          result.push_back(it.second);
        }

        return result;
      }

      bool child (const std::string& kind,
                  const std::string& ns,
                  const std::string& name,
                  ChildObject& result) {
        std::lock_guard<std::mutex> lock(_lock);
        auto it = _children.find(kind + "/" + ns + "/" + name);

        if (it == _children.end()) {
          return false;
        }

        result = it->second;
        return true;
      }

      std::vector<std::string> deletedPods () {
        std::lock_guard<std::mutex> lock(_lock);
        return _deletedPods;
      }

      std::vector<FakeEvent> events () {
        std::lock_guard<std::mutex> lock(_lock);
        return _events;
      }

      size_t countEvents (const std::string& reason) {
        std::lock_guard<std::mutex> lock(_lock);
        size_t n = 0;

        for (const auto& event : _events) {
          if (event.reason == reason) {
            ++n;
          }
        }

        return n;
      }

// -----------------------------------------------------------------------------
// --SECTION--                                                         Platform
// -----------------------------------------------------------------------------

    public:

      Result getCluster (const std::string& key,
                         ClusterResource& result) override {
        std::lock_guard<std::mutex> lock(_lock);
        auto it = _clusters.find(key);

        if (it == _clusters.end()) {
          return Result::error(ResultCode::NOT_FOUND, key + " not found");
        }

        result = it->second;
        return Result::noError();
      }

      Result listClusters (std::vector<ClusterResource>& result) override {
        std::lock_guard<std::mutex> lock(_lock);
        result.clear();

        for (const auto& it : _clusters) {
          result.push_back(it.second);
        }

        return Result::noError();
      }

      Result updateClusterStatus (ClusterResource& cluster) override {
        std::lock_guard<std::mutex> lock(_lock);
        std::string key = clusterKey(cluster.ns(), cluster.name());
        auto it = _clusters.find(key);

        if (it == _clusters.end()) {
          return Result::error(ResultCode::NOT_FOUND, key + " not found");
        }

        if (0 < _injectedConflicts) {
          --_injectedConflicts;
          ++statusConflicts;
          it->second.set_resource_version(nextVersion());
          return Result::error(ResultCode::CONFLICT, "injected conflict");
        }

        if (it->second.resource_version() != cluster.resource_version()) {
          ++statusConflicts;
          return Result::error(ResultCode::CONFLICT,
                               "resourceVersion " + cluster.resource_version()
                               + " is outdated");
        }

        ++statusWrites;
        *it->second.mutable_status() = cluster.status();
        it->second.set_resource_version(nextVersion());
        cluster.set_resource_version(it->second.resource_version());

        return Result::noError();
      }

      Result listChildren (const ClusterResource& cluster,
                           std::vector<ChildObject>& result) override {
        std::lock_guard<std::mutex> lock(_lock);
        result.clear();

        for (const auto& it : _children) {
          const ChildObject& c = it.second;
          auto instance = c.labels().find(LABEL_INSTANCE);

          if (c.ns() == cluster.ns() && instance != c.labels().end()
              && instance->second == cluster.name()) {
            result.push_back(c);
          }
        }

        return Result::noError();
      }

      Result createChild (ChildObject& child) override {
        std::lock_guard<std::mutex> lock(_lock);

        if (_childError.isError()) {
          return _childError;
        }

        std::string key = childKey(child);

        if (_children.find(key) != _children.end()) {
          return Result::error(ResultCode::CONFLICT, key + " already exists");
        }

        ++creates;
        child.set_resource_version(nextVersion());
        child.set_uid("uid-" + child.name());
        _children[key] = child;

        return Result::noError();
      }

      Result updateChild (ChildObject& child) override {
        std::lock_guard<std::mutex> lock(_lock);

        if (_childError.isError()) {
          return _childError;
        }

        std::string key = childKey(child);
        auto it = _children.find(key);

        if (it == _children.end()) {
          return Result::error(ResultCode::NOT_FOUND, key + " not found");
        }

        if (it->second.resource_version() != child.resource_version()) {
          return Result::error(ResultCode::CONFLICT, key + " changed");
        }

        ++updates;
        child.set_resource_version(nextVersion());
        it->second = child;

        return Result::noError();
      }

      Result listMembers (const ClusterResource& cluster,
                          std::vector<Member>& result) override {
        std::lock_guard<std::mutex> lock(_lock);

        if (_membersError.isError()) {
          return _membersError;
        }

        result = _members[clusterKey(cluster.ns(), cluster.name())];
        return Result::noError();
      }

      Result deletePod (const std::string& ns, const std::string& name) override {
        std::lock_guard<std::mutex> lock(_lock);

        if (_deleteError.isError()) {
          return _deleteError;
        }

        _deletedPods.push_back(ns + "/" + name);
        return Result::noError();
      }

      Result recordEvent (const ClusterResource& cluster,
                          const std::string& type,
                          const std::string& reason,
                          const std::string& message) override {
        std::lock_guard<std::mutex> lock(_lock);

        FakeEvent event;
        event.key = clusterKey(cluster.ns(), cluster.name());
        event.type = type;
        event.reason = reason;
        event.message = message;
        _events.push_back(event);

        return Result::noError();
      }

// -----------------------------------------------------------------------------
// --SECTION--                                                         counters
// -----------------------------------------------------------------------------

    public:

      int creates;
      int updates;
      int statusWrites;
      int statusConflicts;

    private:

      std::string nextVersion () {
        return std::to_string(++_version);
      }

      static std::string childKey (const ChildObject& child) {
        return child.kind() + "/" + child.ns() + "/" + child.name();
      }

    private:

      std::mutex _lock;
      uint64_t _version;
      int _injectedConflicts;
      Result _childError;
      Result _membersError;
      Result _deleteError;
      std::map<std::string, ClusterResource> _clusters;
      std::map<std::string, ChildObject> _children;
      std::map<std::string, std::vector<Member>> _members;
      std::vector<std::string> _deletedPods;
      std::vector<FakeEvent> _events;
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
