////////////////////////////////////////////////////////////////////////////////
/// @brief json mapping of the kubernetes objects
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

#include "ClusterCodec.h"

#include "ResourceBuilder.h"

#include <google/protobuf/util/json_util.h>

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                        constants
// -----------------------------------------------------------------------------

const char* const neo4j::CLUSTER_GROUP = "neo4j.neo4j.com";
const char* const neo4j::CLUSTER_VERSION = "v1alpha1";
const char* const neo4j::CLUSTER_KIND = "Neo4jEnterpriseCluster";
const char* const neo4j::CLUSTER_PLURAL = "neo4jenterpriseclusters";

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

static const picojson::value NULL_VALUE;

////////////////////////////////////////////////////////////////////////////////
/// @brief attribute of an object, null if missing or not an object
////////////////////////////////////////////////////////////////////////////////

static const picojson::value& field (const picojson::value& v,
                                     const string& name) {
  if (! v.is<picojson::object>()) {
    return NULL_VALUE;
  }

  const auto& o = v.get<picojson::object>();
  auto it = o.find(name);

  if (it == o.end()) {
    return NULL_VALUE;
  }

  return it->second;
}

static string stringField (const picojson::value& v, const string& name) {
  const auto& f = field(v, name);
  return f.is<string>() ? f.get<string>() : "";
}

static picojson::value num (int64_t value) {
  return picojson::value((double) value);
}

static picojson::value str (const string& value) {
  return picojson::value(value);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief copies a json object of strings into a proto map
////////////////////////////////////////////////////////////////////////////////

static void copyStrings (const picojson::value& v,
                         ::google::protobuf::Map<string, string>* out) {
  if (! v.is<picojson::object>()) {
    return;
  }

  for (const auto& it : v.get<picojson::object>()) {
    if (it.second.is<string>()) {
      (*out)[it.first] = it.second.get<string>();
    }
  }
}

static picojson::value toObject (
  const ::google::protobuf::Map<string, string>& in) {

  picojson::object o;

  for (const auto& it : in) {
    o[it.first] = str(it.second);
  }

  return picojson::value(o);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief parses a json section into a message, unknown fields are ignored
////////////////////////////////////////////////////////////////////////////////

static Result parseMessage (const picojson::value& v,
                            ::google::protobuf::Message* message) {
  message->Clear();

  if (v.is<picojson::null>()) {
    return Result::noError();
  }

  if (! v.is<picojson::object>()) {
    return Result::error(ResultCode::INVALID,
                         message->GetTypeName() + " is not a json object");
  }

  ::google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = ::google::protobuf::util::JsonStringToMessage(
    v.serialize(), message, options);

  if (! status.ok()) {
    return Result::error(ResultCode::INVALID,
                         "cannot decode " + message->GetTypeName() + ": "
                         + status.ToString());
  }

  return Result::noError();
}

static picojson::value encodeCondition (const Condition& condition) {
  picojson::object o;

  o["type"] = str(condition.type());
  o["status"] = str(condition.status());
  o["reason"] = str(condition.reason());
  o["message"] = str(condition.message());
  o["observedGeneration"] = num(condition.observed_generation());
  o["lastTransitionTime"] = str(condition.last_transition_time());

  return picojson::value(o);
}

static picojson::value encodeDiagnostics (const ClusterDiagnostics& diag) {
  picojson::array servers;

  for (const auto& s : diag.servers()) {
    picojson::object o;
    o["name"] = str(s.name());
    o["address"] = str(s.address());
    o["state"] = str(s.state());
    o["health"] = str(s.health());
    o["hostingCount"] = num(s.hosting_count());
    servers.push_back(picojson::value(o));
  }

  picojson::array databases;

  for (const auto& d : diag.databases()) {
    picojson::object o;
    o["name"] = str(d.name());
    o["status"] = str(d.status());
    o["requestedStatus"] = str(d.requested_status());
    o["role"] = str(d.role());
    o["isDefault"] = picojson::value(d.is_default());
    databases.push_back(picojson::value(o));
  }

  picojson::object o;
  o["servers"] = picojson::value(servers);
  o["databases"] = picojson::value(databases);
  o["collectionError"] = str(diag.collection_error());

  if (diag.has_last_collected()) {
    o["lastCollected"] = str(diag.last_collected());
  }
  else {
    o["lastCollected"] = picojson::value();
  }

  return picojson::value(o);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief decodes a cluster resource with metadata, spec and status
////////////////////////////////////////////////////////////////////////////////

Result neo4j::decodeCluster (const picojson::value& v,
                             ClusterResource& cluster) {
  cluster.Clear();

  const auto& metadata = field(v, "metadata");

  if (! metadata.is<picojson::object>()) {
    return Result::error(ResultCode::INVALID, "cluster without metadata");
  }

  cluster.set_name(stringField(metadata, "name"));
  cluster.set_ns(stringField(metadata, "namespace"));
  cluster.set_resource_version(stringField(metadata, "resourceVersion"));
  cluster.set_uid(stringField(metadata, "uid"));

  if (cluster.name().empty()) {
    return Result::error(ResultCode::INVALID, "cluster without name");
  }

  const auto& generation = field(metadata, "generation");

  if (generation.is<double>()) {
    cluster.set_generation((int64_t) generation.get<double>());
  }

  Result res = parseMessage(field(v, "spec"), cluster.mutable_spec());

  if (res.isError()) {
    return res;
  }

  return decodeStatus(field(v, "status"), *cluster.mutable_status());
}

////////////////////////////////////////////////////////////////////////////////
/// @brief encodes a cluster resource as written to the status subresource
////////////////////////////////////////////////////////////////////////////////

picojson::value neo4j::encodeCluster (const ClusterResource& cluster) {
  picojson::object metadata;
  metadata["name"] = str(cluster.name());
  metadata["namespace"] = str(cluster.ns());

  if (! cluster.resource_version().empty()) {
    metadata["resourceVersion"] = str(cluster.resource_version());
  }

  picojson::value spec;
  string specJson;
  auto status = ::google::protobuf::util::MessageToJsonString(
    cluster.spec(), &specJson);

  if (! status.ok()) {
    LOG(WARNING)
    << "cannot encode spec of " << cluster.name() << ": " << status.ToString();
  }
  else if (! picojson::parse(spec, specJson).empty()) {
    spec = picojson::value();
  }

  picojson::object o;
  o["apiVersion"] = str(string(CLUSTER_GROUP) + "/" + CLUSTER_VERSION);
  o["kind"] = str(CLUSTER_KIND);
  o["metadata"] = picojson::value(metadata);

  if (spec.is<picojson::object>()) {
    o["spec"] = spec;
  }

  o["status"] = encodeStatus(cluster.status());

  return picojson::value(o);
}

picojson::value neo4j::encodeStatus (const ClusterStatus& status) {
  picojson::array conditions;

  for (const auto& condition : status.conditions()) {
    conditions.push_back(encodeCondition(condition));
  }

  picojson::object o;
  o["phase"] = str(status.phase());
  o["message"] = str(status.message());
  o["conditions"] = picojson::value(conditions);
  o["observedGeneration"] = num(status.observed_generation());

  if (status.has_replicas()) {
    picojson::object replicas;
    replicas["primaries"] = num(status.replicas().primaries());
    replicas["secondaries"] = num(status.replicas().secondaries());
    replicas["ready"] = num(status.replicas().ready());
    o["replicas"] = picojson::value(replicas);
  }

  if (status.has_endpoints()) {
    picojson::object endpoints;
    endpoints["bolt"] = str(status.endpoints().bolt());
    endpoints["http"] = str(status.endpoints().http());
    endpoints["headless"] = str(status.endpoints().headless());
    o["endpoints"] = picojson::value(endpoints);
  }

  if (status.has_diagnostics()) {
    o["diagnostics"] = encodeDiagnostics(status.diagnostics());
  }

  return picojson::value(o);
}

Result neo4j::decodeStatus (const picojson::value& v, ClusterStatus& status) {
  return parseMessage(v, &status);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief decodes a StatefulSet, Service or ConfigMap
////////////////////////////////////////////////////////////////////////////////

Result neo4j::decodeChild (const string& kind,
                           const string& apiVersion,
                           const picojson::value& v,
                           ChildObject& child) {
  child.Clear();

  const auto& metadata = field(v, "metadata");

  if (! metadata.is<picojson::object>()) {
    return Result::error(ResultCode::INVALID, kind + " without metadata");
  }

  child.set_kind(kind);
  child.set_api_version(apiVersion);
  child.set_name(stringField(metadata, "name"));
  child.set_ns(stringField(metadata, "namespace"));
  child.set_resource_version(stringField(metadata, "resourceVersion"));
  child.set_uid(stringField(metadata, "uid"));

  copyStrings(field(metadata, "labels"), child.mutable_labels());
  copyStrings(field(metadata, "annotations"), child.mutable_annotations());

  if (kind == KIND_CONFIG_MAP) {
    copyStrings(field(v, "data"), child.mutable_data());
  }
  else {
    const auto& spec = field(v, "spec");

    if (spec.is<picojson::object>()) {
      child.set_spec_json(spec.serialize());
    }
  }

  return Result::noError();
}

picojson::value neo4j::encodeChild (const ChildObject& child) {
  picojson::object metadata;
  metadata["name"] = str(child.name());
  metadata["namespace"] = str(child.ns());
  metadata["labels"] = toObject(child.labels());
  metadata["annotations"] = toObject(child.annotations());

  if (! child.resource_version().empty()) {
    metadata["resourceVersion"] = str(child.resource_version());
  }

  picojson::object o;
  o["apiVersion"] = str(child.api_version());
  o["kind"] = str(child.kind());
  o["metadata"] = picojson::value(metadata);

  if (child.kind() == KIND_CONFIG_MAP) {
    o["data"] = toObject(child.data());
  }
  else if (! child.spec_json().empty()) {
    picojson::value spec;
    string err = picojson::parse(spec, child.spec_json());

    if (err.empty()) {
      o["spec"] = spec;
    }
  }

  return picojson::value(o);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief decodes a pod of a cluster into a member
////////////////////////////////////////////////////////////////////////////////

Result neo4j::decodeMember (const ClusterResource& cluster,
                            const picojson::value& pod,
                            Member& member) {
  member.Clear();

  string name = stringField(field(pod, "metadata"), "name");

  if (name.empty()) {
    return Result::error(ResultCode::INVALID, "pod without name");
  }

  member.set_name(name);
  member.set_host(memberHost(cluster, name));

  const auto& status = field(pod, "status");
  bool ready = false;

  if (field(status, "conditions").is<picojson::array>()) {
    for (const auto& c : field(status, "conditions").get<picojson::array>()) {
      if (stringField(c, "type") == "Ready") {
        ready = stringField(c, "status") == "True";
      }
    }
  }

  member.set_running(stringField(status, "phase") == "Running" && ready);

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
