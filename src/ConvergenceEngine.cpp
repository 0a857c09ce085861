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

#include "ConvergenceEngine.h"

#include "ResourceBuilder.h"
#include "utils.h"

#include <algorithm>
#include <map>

#include <glog/logging.h>
#include <picojson.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief key of a child object
////////////////////////////////////////////////////////////////////////////////

static string objectKey (const ChildObject& child) {
  return child.kind() + "/" + child.ns() + "/" + child.name();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief order in which kinds are applied, configuration before servers
////////////////////////////////////////////////////////////////////////////////

static int kindRank (const string& kind) {
  if (kind == KIND_CONFIG_MAP) {
    return 0;
  }

  if (kind == KIND_STATEFUL_SET) {
    return 2;
  }

  return 1;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief annotations maintained by the engine, not part of the content
////////////////////////////////////////////////////////////////////////////////

static bool isEngineAnnotation (const string& name) {
  return name == ANNOTATION_APPLIED_HASH
      || name == ANNOTATION_CONFIG_HASH
      || name == ANNOTATION_RESTARTED_AT;
}

static string appliedHash (const ChildObject& child) {
  auto iter = child.annotations().find(ANNOTATION_APPLIED_HASH);

  if (iter == child.annotations().end()) {
    return "";
  }

  return iter->second;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief copies the restart annotations of the live pod template
////////////////////////////////////////////////////////////////////////////////

static void copyRestartAnnotations (const ChildObject& live,
                                    ChildObject& desired) {
  if (live.spec_json().empty()) {
    return;
  }

  picojson::value l;
  string err = picojson::parse(l, live.spec_json());

  if (! err.empty()) {
    LOG(WARNING)
    << "cannot parse live spec of " << ObjectRef(live).toString() << ": " << err;
    return;
  }

  if (! l.is<picojson::object>()
      || ! l.get("template").is<picojson::object>()
      || ! l.get("template").get("metadata").is<picojson::object>()) {
    return;
  }

  const picojson::value& annotations
    = l.get("template").get("metadata").get("annotations");

  if (! annotations.is<picojson::object>()) {
    return;
  }

  const auto& a = annotations.get<picojson::object>();
  auto hash = a.find(ANNOTATION_CONFIG_HASH);
  auto restarted = a.find(ANNOTATION_RESTARTED_AT);

  if (hash == a.end() || restarted == a.end()
      || ! hash->second.is<string>() || ! restarted->second.is<string>()) {
    return;
  }

  Result res = ConvergenceEngine::stampRestart(
    desired,
    hash->second.get<string>(),
    restarted->second.get<string>());

  if (res.isError()) {
    LOG(WARNING)
    << "cannot keep restart annotations of " << ObjectRef(live).toString()
    << ": " << res.toString();
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

ConvergenceEngine::ConvergenceEngine (Platform& platform,
                                      chrono::steady_clock::duration debounce,
                                      Clock clock)
  : _platform(platform),
    _debounce(debounce),
    _clock(clock) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief converges the live objects of one cluster
////////////////////////////////////////////////////////////////////////////////

Result ConvergenceEngine::converge (const vector<ChildObject>& desired,
                                    const vector<ChildObject>& live,
                                    ScaleTransition transition,
                                    ConvergeResult& result) {
  result = ConvergeResult();

  map<string, const ChildObject*> liveByKey;

  for (const auto& l : live) {
    liveByKey[objectKey(l)] = &l;
  }

  vector<const ChildObject*> ordered;

  for (const auto& d : desired) {
    ordered.push_back(&d);
  }

  stable_sort(ordered.begin(), ordered.end(),
              [] (const ChildObject* a, const ChildObject* b) {
                return kindRank(a->kind()) < kindRank(b->kind());
              });

  bool bypassDebounce = transition == ScaleTransition::SINGLE_TO_MULTI;
  bool restartNeeded = bypassDebounce;
  string configHash;
  const ChildObject* liveStatefulSet = nullptr;
  string now = toRFC3339(chrono::system_clock::now());

  if (bypassDebounce) {
    LOG(INFO)
    << "scale transition " << toString(transition)
    << ", existing servers will be restarted";
  }

  for (const ChildObject* d : ordered) {
    ObjectRef ref(*d);
    string key = objectKey(*d);
    string hash = contentHash(*d);
    auto iter = liveByKey.find(key);

    // .............................................................................
    // object is missing
    // .............................................................................

    if (iter == liveByKey.end()) {
      ChildObject child(*d);
      (*child.mutable_annotations())[ANNOTATION_APPLIED_HASH] = hash;

      LOG(INFO)
      << "creating " << ref.toString() << " with hash " << hash;

      Result res = _platform.createChild(child);

      if (res.isError()) {
        LOG(WARNING)
        << "cannot create " << ref.toString() << ": " << res.toString();
        return res;
      }

      dropPending(key, false);
      result.applied.push_back(ref);

      if (d->kind() == KIND_CONFIG_MAP) {
        configHash = hash;
      }

      continue;
    }

    const ChildObject& l = *iter->second;

    if (d->kind() == KIND_STATEFUL_SET) {
      liveStatefulSet = &l;
    }

    // .............................................................................
    // object is up to date
    // .............................................................................

    if (appliedHash(l) == hash) {
      dropPending(key, true);
      result.skipped.push_back(ref);

      if (d->kind() == KIND_CONFIG_MAP) {
        configHash = hash;
      }

      continue;
    }

    // .............................................................................
    // configuration changes wait for the quiet window
    // .............................................................................

    if (d->kind() == KIND_CONFIG_MAP && ! bypassDebounce) {
      chrono::steady_clock::duration wait;

      if (debounced(*d, hash, wait)) {
        result.skipped.push_back(ref);
        result.deferred.push_back(ref);

        if (result.recheckAfter == chrono::steady_clock::duration::zero()
            || wait < result.recheckAfter) {
          result.recheckAfter = wait;
        }

        continue;
      }
    }

    // .............................................................................
    // object must be updated
    // .............................................................................

    ChildObject child(*d);
    (*child.mutable_annotations())[ANNOTATION_APPLIED_HASH] = hash;
    child.set_resource_version(l.resource_version());
    child.set_uid(l.uid());

    if (d->kind() == KIND_STATEFUL_SET) {
      copyRestartAnnotations(l, child);

      if (restartNeeded) {
        Result res = stampRestart(child, configHash, now);

        if (res.isError()) {
          return res;
        }

        result.restartScheduled = true;
      }
    }

    LOG(INFO)
    << "updating " << ref.toString() << ", hash " << appliedHash(l)
    << " -> " << hash;

    Result res = _platform.updateChild(child);

    if (res.isError()) {
      LOG(WARNING)
      << "cannot update " << ref.toString() << ": " << res.toString();
      return res;
    }

    dropPending(key, false);
    result.applied.push_back(ref);

    if (d->kind() == KIND_CONFIG_MAP) {
      configHash = hash;
      restartNeeded = true;
    }
  }

  // .............................................................................
  // restart the existing servers if the configuration changed
  // .............................................................................

  if (restartNeeded && ! result.restartScheduled && liveStatefulSet != nullptr) {
    ChildObject child(*liveStatefulSet);
    Result res = stampRestart(child, configHash, now);

    if (res.isError()) {
      return res;
    }

    LOG(INFO)
    << "restarting servers of " << ObjectRef(child).toString()
    << " for configuration " << configHash;

    res = _platform.updateChild(child);

    if (res.isError()) {
      LOG(WARNING)
      << "cannot restart servers of " << ObjectRef(child).toString()
      << ": " << res.toString();
      return res;
    }

    result.restartScheduled = true;
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief drops the pending changes of a deleted cluster
////////////////////////////////////////////////////////////////////////////////

void ConvergenceEngine::forget (const string& clusterKey) {
  lock_guard<mutex> lock(_lock);

  for (auto iter = _pending.begin(); iter != _pending.end();) {
    if (iter->second.cluster == clusterKey) {
      iter = _pending.erase(iter);
    }
    else {
      ++iter;
    }
  }
}

size_t ConvergenceEngine::pendingChanges () {
  lock_guard<mutex> lock(_lock);
  return _pending.size();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief hash of the semantically relevant fields of an object
////////////////////////////////////////////////////////////////////////////////

string ConvergenceEngine::contentHash (const ChildObject& child) {
  vector<string> fields;

  fields.push_back(child.kind());
  fields.push_back(child.api_version());
  fields.push_back(child.ns());
  fields.push_back(child.name());

  // protobuf maps have no stable iteration order
  map<string, string> labels(child.labels().begin(), child.labels().end());

  for (const auto& label : labels) {
    fields.push_back("label:" + label.first + "=" + label.second);
  }

  map<string, string> annotations;

  for (const auto& annotation : child.annotations()) {
    if (! isEngineAnnotation(annotation.first)) {
      annotations.insert(annotation);
    }
  }

  for (const auto& annotation : annotations) {
    fields.push_back("annotation:" + annotation.first + "=" + annotation.second);
  }

  map<string, string> data(child.data().begin(), child.data().end());

  for (const auto& entry : data) {
    fields.push_back("data:" + entry.first);
    fields.push_back(entry.second);
  }

  fields.push_back("spec:" + child.spec_json());

  return toHex(FnvHashString(fields));
}

////////////////////////////////////////////////////////////////////////////////
/// @brief stamps the restart annotations into the pod template
////////////////////////////////////////////////////////////////////////////////

Result ConvergenceEngine::stampRestart (ChildObject& statefulSet,
                                        const string& configHash,
                                        const string& now) {
  picojson::value spec;

  if (statefulSet.spec_json().empty()) {
    spec = picojson::value(picojson::object());
  }
  else {
    string err = picojson::parse(spec, statefulSet.spec_json());

    if (! err.empty()) {
      return Result::error(ResultCode::INTERNAL,
                           "cannot parse spec of "
                           + ObjectRef(statefulSet).toString() + ": " + err);
    }
  }

  if (! spec.is<picojson::object>()) {
    return Result::error(ResultCode::INTERNAL,
                         "spec of " + ObjectRef(statefulSet).toString()
                         + " is not an object");
  }

  picojson::object& s = spec.get<picojson::object>();

  if (! s["template"].is<picojson::object>()) {
    s["template"] = picojson::value(picojson::object());
  }

  picojson::object& t = s["template"].get<picojson::object>();

  if (! t["metadata"].is<picojson::object>()) {
    t["metadata"] = picojson::value(picojson::object());
  }

  picojson::object& m = t["metadata"].get<picojson::object>();

  if (! m["annotations"].is<picojson::object>()) {
    m["annotations"] = picojson::value(picojson::object());
  }

  picojson::object& a = m["annotations"].get<picojson::object>();
  a[ANNOTATION_CONFIG_HASH] = picojson::value(configHash);
  a[ANNOTATION_RESTARTED_AT] = picojson::value(now);

  statefulSet.set_spec_json(spec.serialize());

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief checks the debounce window of a changed object, returns true if
/// the change must wait and stores the remaining time in wait
////////////////////////////////////////////////////////////////////////////////

bool ConvergenceEngine::debounced (const ChildObject& desired,
                                   const string& hash,
                                   chrono::steady_clock::duration& wait) {
  if (_debounce <= chrono::steady_clock::duration::zero()) {
    return false;
  }

  string key = objectKey(desired);
  auto now = _clock();

  lock_guard<mutex> lock(_lock);

  auto iter = _pending.find(key);

  if (iter == _pending.end() || iter->second.hash != hash) {
    auto instance = desired.labels().find(LABEL_INSTANCE);
    string cluster = clusterKey(
      desired.ns(),
      instance == desired.labels().end() ? "" : instance->second);

    LOG(INFO)
    << "deferring change of " << ObjectRef(desired).toString() << " to "
    << hash << " for "
    << chrono::duration_cast<chrono::seconds>(_debounce).count() << "s";

    _pending[key] = PendingChange{ hash, cluster, now };
    wait = _debounce;
    return true;
  }

  auto elapsed = now - iter->second.since;

  if (elapsed < _debounce) {
    wait = _debounce - elapsed;
    return true;
  }

  return false;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief forgets a pending change
////////////////////////////////////////////////////////////////////////////////

void ConvergenceEngine::dropPending (const string& key, bool reverted) {
  lock_guard<mutex> lock(_lock);

  auto iter = _pending.find(key);

  if (iter == _pending.end()) {
    return;
  }

  if (reverted) {
    LOG(INFO)
    << "discarding pending change of " << key << " to " << iter->second.hash
    << ", content is back to the applied one";
  }

  _pending.erase(iter);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
