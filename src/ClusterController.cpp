////////////////////////////////////////////////////////////////////////////////
/// @brief controller for the cluster resources
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

#include "ClusterController.h"

#include "utils.h"

#include <set>

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

ClusterController::ClusterController (Platform& platform,
                                      Reconciler& reconciler,
                                      const Options& options)
  : _platform(platform),
    _reconciler(reconciler),
    _options(options),
    _monitor(options.healthInterval,
             [this] (const string& key) { healthTick(key); }),
    _queue(new WorkQueue()),
    _stop(false),
    _running(false) {

  _reconciler.setHealthMonitor(&_monitor);
}

ClusterController::~ClusterController () {
  stop();
  _reconciler.setHealthMonitor(nullptr);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief starts the workers, the poll thread and the health monitor
////////////////////////////////////////////////////////////////////////////////

void ClusterController::start () {
  lock_guard<mutex> lifecycle(_lifecycle);

  if (_running) {
    return;
  }

  if (_queue->shuttingDown()) {
    _queue.reset(new WorkQueue());
  }

  {
    lock_guard<mutex> lock(_lock);
    _stop = false;
    _known.clear();
  }

  LOG(INFO)
  << "starting controller with " << _options.workers << " worker(s)";

  for (int i = 0; i < _options.workers; ++i) {
    _workers.emplace_back(new thread(&ClusterController::worker, this));
  }

  _poller.reset(new thread(&ClusterController::pollLoop, this));
  _monitor.start();

  _running = true;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief stops and joins all threads
////////////////////////////////////////////////////////////////////////////////

void ClusterController::stop () {
  lock_guard<mutex> lifecycle(_lifecycle);

  if (! _running) {
    return;
  }

  LOG(INFO) << "stopping controller";

  {
    lock_guard<mutex> lock(_lock);
    _stop = true;
  }

  _wakeup.notify_all();

  if (_poller != nullptr) {
    _poller->join();
    _poller.reset();
  }

  _monitor.stop();
  _queue->shutDown();

  for (auto& worker : _workers) {
    worker->join();
  }

  _workers.clear();
  _running = false;
}

bool ClusterController::running () {
  lock_guard<mutex> lifecycle(_lifecycle);
  return _running;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief lists the clusters once and enqueues the changed keys
////////////////////////////////////////////////////////////////////////////////

Result ClusterController::poll (bool resync) {
  vector<ClusterResource> clusters;
  Result res = _platform.listClusters(clusters);

  if (res.isError()) {
    LOG(WARNING) << "cannot list clusters: " << res.toString();
    return res;
  }

  vector<string> changed;

  {
    lock_guard<mutex> lock(_lock);
    set<string> seen;

    for (const auto& cluster : clusters) {
      string key = clusterKey(cluster.ns(), cluster.name());
      string version = cluster.uid() + "/" + to_string(cluster.generation());

      seen.insert(key);

      auto it = _known.find(key);

      if (resync || it == _known.end() || it->second != version) {
        changed.push_back(key);
      }

      _known[key] = version;
    }

    for (auto it = _known.begin(); it != _known.end();) {
      if (seen.find(it->first) == seen.end()) {
        changed.push_back(it->first);
        _states.erase(it->first);
        it = _known.erase(it);
      }
      else {
        ++it;
      }
    }
  }

  for (const auto& key : changed) {
    VLOG(1) << "enqueueing " << key;
    _queue->add(key);
  }

  return Result::noError();
}

void ClusterController::enqueue (const string& key) {
  _queue->add(key);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief takes one key from the queue and reconciles it
////////////////////////////////////////////////////////////////////////////////

bool ClusterController::processNext () {
  string key;

  if (! _queue->get(key)) {
    return false;
  }

  ReconcileOutcome outcome;
  Result res = _reconciler.reconcile(key, outcome);

  if (res.isError()) {
    _queue->addRateLimited(key);
  }
  else {
    _queue->forget(key);

    if (outcome.requeueAfter > chrono::steady_clock::duration::zero()) {
      _queue->addAfter(key, outcome.requeueAfter);
    }
  }

  record(key, outcome, res);
  _queue->done(key);

  return true;
}

map<string, ClusterState> ClusterController::snapshot () {
  lock_guard<mutex> lock(_lock);
  return _states;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

void ClusterController::worker () {
  while (processNext()) {
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief polls until stopped, with a full resync once per resync interval
////////////////////////////////////////////////////////////////////////////////

void ClusterController::pollLoop () {
  auto lastResync = chrono::steady_clock::now();
  bool first = true;

  while (true) {
    auto now = chrono::steady_clock::now();
    bool resync = first || now - lastResync >= _options.resyncInterval;

    if (resync) {
      lastResync = now;
    }

    Result res = poll(resync);

    if (res.isError()) {
      VLOG(1) << "poll failed, retrying in " << _options.pollInterval.count() << "ms";
    }

    first = false;

    unique_lock<mutex> lock(_lock);

    if (_wakeup.wait_for(lock, _options.pollInterval, [this] { return _stop; })) {
      return;
    }
  }
}

void ClusterController::healthTick (const string& key) {
  Result res = _reconciler.refreshDiagnostics(key);

  if (res.isError()) {
    LOG(WARNING)
    << "periodic diagnostics of " << key << " failed: " << res.toString();
  }
}

void ClusterController::record (const string& key,
                                const ReconcileOutcome& outcome,
                                const Result& res) {
  lock_guard<mutex> lock(_lock);

  if (_known.find(key) == _known.end() && outcome.phase.empty()
      && ! res.isError()) {
    _states.erase(key);
    return;
  }

  ClusterState& state = _states[key];

  if (! outcome.phase.empty()) {
    state.phase = outcome.phase;
  }

  state.lastResult = res.toString();
  state.lastReconciled = toRFC3339(chrono::system_clock::now());
  ++state.reconciles;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
