////////////////////////////////////////////////////////////////////////////////
/// @brief platform implementation on the kubernetes api
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

#include "KubePlatform.h"

#include "ClusterCodec.h"
#include "ResourceBuilder.h"
#include "utils.h"

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

static const char* const CONTENT_JSON = "application/json";
static const char* const CONTENT_MERGE_PATCH = "application/merge-patch+json";

static string selector (const vector<pair<string, string>>& labels) {
  vector<string> parts;

  for (const auto& label : labels) {
    parts.push_back(label.first + "=" + label.second);
  }

  return urlEncode(join(parts, ","));
}

static const picojson::array* items (const picojson::value& list) {
  if (! list.is<picojson::object>()) {
    return nullptr;
  }

  const auto& o = list.get<picojson::object>();
  auto it = o.find("items");

  if (it == o.end() || ! it->second.is<picojson::array>()) {
    return nullptr;
  }

  return &it->second.get<picojson::array>();
}

static void copyMetadata (const picojson::value& response, ChildObject& child) {
  ChildObject stored;
  Result res = decodeChild(child.kind(), child.api_version(), response, stored);

  if (res.isError()) {
    LOG(WARNING)
    << "cannot read back " << child.kind() << " " << child.name() << ": "
    << res.toString();
    return;
  }

  child.set_resource_version(stored.resource_version());
  child.set_uid(stored.uid());
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

KubePlatform::KubePlatform (const Options& options)
  : _options(options) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

Result KubePlatform::getCluster (const string& key, ClusterResource& result) {
  string ns;
  string name;

  if (! splitClusterKey(key, ns, name)) {
    return Result::error(ResultCode::INVALID, "malformed cluster key '" + key + "'");
  }

  picojson::value v;
  Result res = request("GET", clusterPath(ns) + "/" + name, "", "", v);

  if (res.isError()) {
    return res;
  }

  return decodeCluster(v, result);
}

Result KubePlatform::listClusters (vector<ClusterResource>& result) {
  result.clear();

  picojson::value v;
  Result res = request("GET", clusterPath(_options.ns), "", "", v);

  if (res.isError()) {
    return res;
  }

  const picojson::array* list = items(v);

  if (list == nullptr) {
    return Result::error(ResultCode::UNAVAILABLE, "cluster list without items");
  }

  for (const auto& item : *list) {
    ClusterResource cluster;
    res = decodeCluster(item, cluster);

    if (res.isError()) {
      LOG(WARNING) << "skipping cluster: " << res.toString();
      continue;
    }

    result.push_back(cluster);
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief writes the status subresource, 409 means the resource changed
////////////////////////////////////////////////////////////////////////////////

Result KubePlatform::updateClusterStatus (ClusterResource& cluster) {
  string path = clusterPath(cluster.ns()) + "/" + cluster.name() + "/status";
  picojson::value v;

  Result res = request("PUT", path, encodeCluster(cluster).serialize(),
                       CONTENT_JSON, v);

  if (res.isError()) {
    return res;
  }

  ClusterResource stored;
  res = decodeCluster(v, stored);

  if (res.isError()) {
    LOG(WARNING)
    << "cannot read back status of " << cluster.name() << ": " << res.toString();
    return Result::noError();
  }

  cluster.set_resource_version(stored.resource_version());
  return Result::noError();
}

Result KubePlatform::listChildren (const ClusterResource& cluster,
                                   vector<ChildObject>& result) {
  result.clear();

  string query = "?labelSelector=" + selector({
    { LABEL_INSTANCE, cluster.name() },
    { LABEL_MANAGED_BY, MANAGED_BY_VALUE }
  });

  for (const string kind : { KIND_CONFIG_MAP, KIND_SERVICE, KIND_STATEFUL_SET }) {
    picojson::value v;
    Result res = request("GET", childPath(kind, cluster.ns()) + query, "", "", v);

    if (res.isError()) {
      return res;
    }

    const picojson::array* list = items(v);

    if (list == nullptr) {
      return Result::error(ResultCode::UNAVAILABLE, kind + " list without items");
    }

    for (const auto& item : *list) {
      ChildObject child;
      res = decodeChild(kind, apiVersionOf(kind), item, child);

      if (res.isError()) {
        LOG(WARNING) << "skipping " << kind << ": " << res.toString();
        continue;
      }

      result.push_back(child);
    }
  }

  return Result::noError();
}

Result KubePlatform::createChild (ChildObject& child) {
  ChildObject body = child;
  body.clear_resource_version();
  body.clear_uid();

  picojson::value v;
  Result res = request("POST", childPath(child.kind(), child.ns()),
                       encodeChild(body).serialize(), CONTENT_JSON, v);

  if (res.isError()) {
    return res;
  }

  copyMetadata(v, child);
  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief updates a child object with a merge patch
////////////////////////////////////////////////////////////////////////////////

Result KubePlatform::updateChild (ChildObject& child) {
  string path = childPath(child.kind(), child.ns()) + "/" + child.name();
  picojson::value v;

  Result res = request("PATCH", path, encodeChild(child).serialize(),
                       CONTENT_MERGE_PATCH, v);

  if (res.isError()) {
    return res;
  }

  copyMetadata(v, child);
  return Result::noError();
}

Result KubePlatform::listMembers (const ClusterResource& cluster,
                                  vector<Member>& result) {
  result.clear();

  string path = "/api/v1/namespaces/" + cluster.ns() + "/pods?labelSelector="
              + selector({ { LABEL_CLUSTER, cluster.name() },
                           { LABEL_CLUSTERING, "true" } });

  picojson::value v;
  Result res = request("GET", path, "", "", v);

  if (res.isError()) {
    return res;
  }

  const picojson::array* list = items(v);

  if (list == nullptr) {
    return Result::error(ResultCode::UNAVAILABLE, "pod list without items");
  }

  for (const auto& item : *list) {
    Member member;
    res = decodeMember(cluster, item, member);

    if (res.isError()) {
      LOG(WARNING) << "skipping pod: " << res.toString();
      continue;
    }

    result.push_back(member);
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes a pod, a pod which is already gone counts as deleted
////////////////////////////////////////////////////////////////////////////////

Result KubePlatform::deletePod (const string& ns, const string& name) {
  picojson::value v;
  Result res = request("DELETE", "/api/v1/namespaces/" + ns + "/pods/" + name,
                       "", "", v);

  if (res.code() == ResultCode::NOT_FOUND) {
    return Result::noError();
  }

  return res;
}

Result KubePlatform::recordEvent (const ClusterResource& cluster,
                                  const string& type,
                                  const string& reason,
                                  const string& message) {
  string now = toRFC3339(chrono::system_clock::now());
  picojson::value v;

  return request("POST", "/api/v1/namespaces/" + cluster.ns() + "/events",
                 encodeEvent(cluster, type, reason, message, now).serialize(),
                 CONTENT_JSON, v);
}

// -----------------------------------------------------------------------------
// --SECTION--                                            static public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief maps an HTTP status of the api server to a result
////////////////////////////////////////////////////////////////////////////////

Result KubePlatform::fromHttpCode (long httpCode, const string& what) {
  if (200 <= httpCode && httpCode < 300) {
    return Result::noError();
  }

  string message = what + " returned HTTP " + to_string(httpCode);

  switch (httpCode) {
    case 409:
      return Result::error(ResultCode::CONFLICT, message);

    case 404:
      return Result::error(ResultCode::NOT_FOUND, message);

    case 401:
    case 403:
      return Result::error(ResultCode::AUTH, message);

    case 400:
    case 422:
      return Result::error(ResultCode::INVALID, message);

    case 408:
    case 504:
      return Result::error(ResultCode::TIMEOUT, message);

    default:
      return Result::error(ResultCode::UNAVAILABLE, message);
  }
}

string KubePlatform::childPath (const string& kind, const string& ns) {
  if (kind == KIND_STATEFUL_SET) {
    return "/apis/apps/v1/namespaces/" + ns + "/statefulsets";
  }

  if (kind == KIND_SERVICE) {
    return "/api/v1/namespaces/" + ns + "/services";
  }

  return "/api/v1/namespaces/" + ns + "/configmaps";
}

string KubePlatform::apiVersionOf (const string& kind) {
  return kind == KIND_STATEFUL_SET ? "apps/v1" : "v1";
}

picojson::value KubePlatform::encodeEvent (const ClusterResource& cluster,
                                           const string& type,
                                           const string& reason,
                                           const string& message,
                                           const string& now) {
  picojson::object metadata;
  metadata["generateName"] = picojson::value(cluster.name() + ".");
  metadata["namespace"] = picojson::value(cluster.ns());

  picojson::object involved;
  involved["apiVersion"] = picojson::value(string(CLUSTER_GROUP) + "/" + CLUSTER_VERSION);
  involved["kind"] = picojson::value(CLUSTER_KIND);
  involved["name"] = picojson::value(cluster.name());
  involved["namespace"] = picojson::value(cluster.ns());

  if (! cluster.uid().empty()) {
    involved["uid"] = picojson::value(cluster.uid());
  }

  picojson::object source;
  source["component"] = picojson::value(MANAGED_BY_VALUE);

  picojson::object event;
  event["apiVersion"] = picojson::value("v1");
  event["kind"] = picojson::value("Event");
  event["metadata"] = picojson::value(metadata);
  event["involvedObject"] = picojson::value(involved);
  event["type"] = picojson::value(type);
  event["reason"] = picojson::value(reason);
  event["message"] = picojson::value(message);
  event["source"] = picojson::value(source);
  event["firstTimestamp"] = picojson::value(now);
  event["lastTimestamp"] = picojson::value(now);
  event["count"] = picojson::value(1.0);

  return picojson::value(event);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief does one api request and parses the answer
////////////////////////////////////////////////////////////////////////////////

Result KubePlatform::request (const string& method,
                              const string& path,
                              const string& body,
                              const string& contentType,
                              picojson::value& result) {
  HttpOptions options;
  options.timeoutMs = _options.timeoutMs;
  options.bearerToken = _options.token;
  options.caFile = _options.caFile;
  options.headers.push_back("Accept: application/json");

  if (! contentType.empty()) {
    options.headers.push_back("Content-Type: " + contentType);
  }

  string what = method + " " + path;
  string resultBody;
  long httpCode = 0;

  int res = doHTTPRequest(method, _options.apiServer + path, body, options,
                          resultBody, httpCode);

  if (res != 0) {
    if (isHTTPTimeout(res)) {
      return Result::error(ResultCode::TIMEOUT, what + " timed out");
    }

    return Result::error(ResultCode::UNAVAILABLE,
                         what + " failed, curl error " + to_string(res));
  }

  Result status = fromHttpCode(httpCode, what);

  if (status.isError()) {
    VLOG(1) << status.toString() << ": " << resultBody;
    return status;
  }

  if (resultBody.empty()) {
    result = picojson::value();
    return Result::noError();
  }

  string err = picojson::parse(result, resultBody);

  if (! err.empty()) {
    return Result::error(ResultCode::UNAVAILABLE,
                         what + " returned malformed json: " + err);
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief path of the cluster collection, cluster wide if ns is empty
////////////////////////////////////////////////////////////////////////////////

string KubePlatform::clusterPath (const string& ns) const {
  string base = string("/apis/") + CLUSTER_GROUP + "/" + CLUSTER_VERSION;

  if (ns.empty()) {
    return base + "/" + CLUSTER_PLURAL;
  }

  return base + "/namespaces/" + ns + "/" + CLUSTER_PLURAL;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
