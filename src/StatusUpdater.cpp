////////////////////////////////////////////////////////////////////////////////
/// @brief conflict retrying status writes
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

#include "StatusUpdater.h"

#include "utils.h"

#include <thread>

#include <glog/logging.h>
#include <google/protobuf/util/message_differencer.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

StatusUpdater::StatusUpdater (Platform& platform,
                              OperatorMetrics& metrics,
                              int maxAttempts,
                              chrono::milliseconds baseDelay,
                              chrono::milliseconds maxDelay)
  : _platform(platform),
    _metrics(metrics),
    _maxAttempts(maxAttempts < 1 ? 1 : maxAttempts),
    _baseDelay(baseDelay),
    _maxDelay(maxDelay),
    _sleeper([] (chrono::milliseconds d) { this_thread::sleep_for(d); }),
    _random(random_device()()) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief applies a mutation to the status of the cluster with the given key
////////////////////////////////////////////////////////////////////////////////

Result StatusUpdater::updateStatus (const string& key, const Mutation& mutate) {
  string ns;
  string name;

  if (! splitClusterKey(key, ns, name)) {
    return Result::error(ResultCode::INVALID, "malformed cluster key '" + key + "'");
  }

  Result last;

  for (int attempt = 1; attempt <= _maxAttempts; ++attempt) {
    ClusterResource cluster;
    Result res = _platform.getCluster(key, cluster);

    if (res.isError()) {
      if (! res.isTransient()) {
        return res;
      }

      last = res;
    }
    else {
      ClusterStatus status(cluster.status());
      mutate(status);

      if (google::protobuf::util::MessageDifferencer::Equals(status, cluster.status())) {
        return Result::noError();
      }

      cluster.mutable_status()->Swap(&status);
      res = _platform.updateClusterStatus(cluster);

      if (! res.isError()) {
        if (attempt > 1) {
          LOG(INFO)
          << "status of " << key << " written after " << attempt << " attempts";
        }

        return res;
      }

      if (res.code() == ResultCode::CONFLICT) {
        _metrics.resourceVersionConflicts->inc({ name, ns });

        LOG(INFO)
        << "status write of " << key << " conflicted (attempt " << attempt
        << " of " << _maxAttempts << "), re-reading";
      }
      else if (! res.isTransient()) {
        return res;
      }

      last = res;
    }

    if (attempt < _maxAttempts) {
      _sleeper(backoff(attempt));
    }
  }

  LOG(WARNING)
  << "giving up status write of " << key << " after " << _maxAttempts
  << " attempts: " << last.toString();

  return Result::error(
    last.code() == ResultCode::CONFLICT ? ResultCode::CONFLICT
                                        : ResultCode::UNAVAILABLE,
    "status update of " + key + " not possible after "
    + to_string(_maxAttempts) + " attempts: " + last.errorMessage());
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief exponential backoff with jitter, bounded by maxDelay
////////////////////////////////////////////////////////////////////////////////

chrono::milliseconds StatusUpdater::backoff (int attempt) {
  int64_t delay = _baseDelay.count();

  for (int i = 1; i < attempt && delay < _maxDelay.count(); ++i) {
    delay *= 2;
  }

  if (delay > _maxDelay.count()) {
    delay = _maxDelay.count();
  }

  int64_t jitter = 0;

  if (delay > 1) {
    lock_guard<mutex> lock(_randomLock);
    uniform_int_distribution<int64_t> dist(0, delay / 2);
    jitter = dist(_random);
  }

  return chrono::milliseconds(delay + jitter);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
