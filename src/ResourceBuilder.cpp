////////////////////////////////////////////////////////////////////////////////
/// @brief desired child objects of a cluster
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

#include "ResourceBuilder.h"

#include "Platform.h"

#include <sstream>

#include <picojson.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                          labels and annotations
// -----------------------------------------------------------------------------

const char* const neo4j::LABEL_NAME = "app.kubernetes.io/name";
const char* const neo4j::LABEL_INSTANCE = "app.kubernetes.io/instance";
const char* const neo4j::LABEL_MANAGED_BY = "app.kubernetes.io/managed-by";
const char* const neo4j::LABEL_COMPONENT = "app.kubernetes.io/component";
const char* const neo4j::LABEL_CLUSTER = "neo4j.com/cluster";
const char* const neo4j::LABEL_CLUSTERING = "neo4j.com/clustering";

const char* const neo4j::MANAGED_BY_VALUE = "neo4j-operator";

const char* const neo4j::ANNOTATION_APPLIED_HASH = "neo4j.com/applied-hash";
const char* const neo4j::ANNOTATION_PRIMARIES = "neo4j.com/primaries";
const char* const neo4j::ANNOTATION_IMAGE = "neo4j.com/image";
const char* const neo4j::ANNOTATION_CONFIG_HASH = "neo4j.com/config-hash";
const char* const neo4j::ANNOTATION_RESTARTED_AT = "neo4j.com/restarted-at";

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

namespace {
  const int BoltPort = 7687;
  const int HttpPort = 7474;
  const int DiscoveryPort = 5000;
  const int RaftPort = 7000;

  picojson::value num (int64_t value) {
    return picojson::value((double) value);
  }

  picojson::value str (const string& value) {
    return picojson::value(value);
  }

  picojson::object port (const string& name, int number) {
    picojson::object p;
    p["name"] = str(name);
    p["port"] = num(number);
    p["targetPort"] = num(number);
    p["protocol"] = str("TCP");
    return p;
  }

  picojson::object containerPort (const string& name, int number) {
    picojson::object p;
    p["name"] = str(name);
    p["containerPort"] = num(number);
    p["protocol"] = str("TCP");
    return p;
  }

////////////////////////////////////////////////////////////////////////////////
/// @brief labels selecting the pods of a cluster
////////////////////////////////////////////////////////////////////////////////

  picojson::object selectorLabels (const ClusterResource& cluster) {
    picojson::object labels;
    labels[LABEL_NAME] = str("neo4j");
    labels[LABEL_INSTANCE] = str(cluster.name());
    return labels;
  }

  void commonMetadata (const ClusterResource& cluster,
                       const string& component,
                       ChildObject& child) {
    child.set_ns(cluster.ns());

    auto& labels = *child.mutable_labels();
    labels[LABEL_NAME] = "neo4j";
    labels[LABEL_INSTANCE] = cluster.name();
    labels[LABEL_MANAGED_BY] = MANAGED_BY_VALUE;
    labels[LABEL_COMPONENT] = component;
    labels[LABEL_CLUSTER] = cluster.name();
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

string neo4j::statefulSetName (const ClusterResource& cluster) {
  return cluster.name() + "-server";
}

string neo4j::headlessServiceName (const ClusterResource& cluster) {
  return cluster.name() + "-headless";
}

string neo4j::clientServiceName (const ClusterResource& cluster) {
  return cluster.name() + "-client";
}

string neo4j::configMapName (const ClusterResource& cluster) {
  return cluster.name() + "-config";
}

string neo4j::clientServiceHost (const ClusterResource& cluster) {
  return clientServiceName(cluster) + "." + cluster.ns() + ".svc.cluster.local";
}

string neo4j::memberHost (const ClusterResource& cluster,
                          const string& podName) {
  return podName + "." + headlessServiceName(cluster) + "."
       + cluster.ns() + ".svc.cluster.local";
}

string neo4j::imageReference (const ClusterSpec& spec) {
  return spec.image().repo() + ":" + spec.image().tag();
}

int32_t neo4j::expectedServers (const ClusterSpec& spec) {
  return spec.topology().primaries() + spec.topology().secondaries();
}

// -----------------------------------------------------------------------------
// --SECTION--                                            class ResourceBuilder
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief all desired child objects, configuration first
////////////////////////////////////////////////////////////////////////////////

vector<ChildObject> ResourceBuilder::desiredState (
  const ClusterResource& cluster) const {

  vector<ChildObject> result;

  result.push_back(buildConfigMap(cluster));
  result.push_back(buildHeadlessService(cluster));
  result.push_back(buildClientService(cluster));
  result.push_back(buildStatefulSet(cluster));

  return result;
}

// -----------------------------------------------------------------------------
// --SECTION--                                     class DefaultResourceBuilder
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief the server StatefulSet
////////////////////////////////////////////////////////////////////////////////

ChildObject DefaultResourceBuilder::buildStatefulSet (
  const ClusterResource& cluster) const {

  const ClusterSpec& spec = cluster.spec();

  ChildObject child;
  child.set_kind(KIND_STATEFUL_SET);
  child.set_api_version("apps/v1");
  child.set_name(statefulSetName(cluster));
  commonMetadata(cluster, "server", child);

  auto& annotations = *child.mutable_annotations();
  annotations[ANNOTATION_PRIMARIES] = to_string(spec.topology().primaries());
  annotations[ANNOTATION_IMAGE] = imageReference(spec);

  // pod template
  picojson::object podLabels = selectorLabels(cluster);
  podLabels[LABEL_CLUSTER] = str(cluster.name());
  podLabels[LABEL_CLUSTERING] = str("true");

  picojson::object templateMetadata;
  templateMetadata["labels"] = picojson::value(podLabels);
  templateMetadata["annotations"] = picojson::value(picojson::object());

  picojson::array ports;
  ports.push_back(picojson::value(containerPort("bolt", BoltPort)));
  ports.push_back(picojson::value(containerPort("http", HttpPort)));
  ports.push_back(picojson::value(containerPort("tcp-discovery", DiscoveryPort)));
  ports.push_back(picojson::value(containerPort("tcp-raft", RaftPort)));

  picojson::array env;
  {
    picojson::object accept;
    accept["name"] = str("NEO4J_ACCEPT_LICENSE_AGREEMENT");
    accept["value"] = str("yes");
    env.push_back(picojson::value(accept));
  }

  if (! spec.auth().admin_secret().empty()) {
    picojson::object keyRef;
    keyRef["name"] = str(spec.auth().admin_secret());
    keyRef["key"] = str("NEO4J_AUTH");

    picojson::object valueFrom;
    valueFrom["secretKeyRef"] = picojson::value(keyRef);

    picojson::object auth;
    auth["name"] = str("NEO4J_AUTH");
    auth["valueFrom"] = picojson::value(valueFrom);
    env.push_back(picojson::value(auth));
  }

  picojson::array mounts;
  {
    picojson::object data;
    data["name"] = str("data");
    data["mountPath"] = str("/data");
    mounts.push_back(picojson::value(data));

    picojson::object config;
    config["name"] = str("config");
    config["mountPath"] = str("/config");
    mounts.push_back(picojson::value(config));
  }

  picojson::object tcp;
  tcp["port"] = num(BoltPort);

  picojson::object readiness;
  readiness["tcpSocket"] = picojson::value(tcp);
  readiness["initialDelaySeconds"] = num(10);
  readiness["periodSeconds"] = num(10);

  picojson::array command;
  command.push_back(str("/bin/bash"));
  command.push_back(str("/config/startup.sh"));

  picojson::object container;
  container["name"] = str("neo4j");
  container["image"] = str(imageReference(spec));
  container["imagePullPolicy"] = str(spec.image().pull_policy());
  container["command"] = picojson::value(command);
  container["ports"] = picojson::value(ports);
  container["env"] = picojson::value(env);
  container["volumeMounts"] = picojson::value(mounts);
  container["readinessProbe"] = picojson::value(readiness);

  picojson::array containers;
  containers.push_back(picojson::value(container));

  picojson::object configMapRef;
  configMapRef["name"] = str(configMapName(cluster));

  picojson::object configVolume;
  configVolume["name"] = str("config");
  configVolume["configMap"] = picojson::value(configMapRef);

  picojson::array volumes;
  volumes.push_back(picojson::value(configVolume));

  picojson::object podSpec;
  podSpec["containers"] = picojson::value(containers);
  podSpec["volumes"] = picojson::value(volumes);
  podSpec["terminationGracePeriodSeconds"] = num(60);

  picojson::object podTemplate;
  podTemplate["metadata"] = picojson::value(templateMetadata);
  podTemplate["spec"] = picojson::value(podSpec);

  // volume claim template
  picojson::object requests;
  requests["storage"] = str(spec.storage().size());

  picojson::object resources;
  resources["requests"] = picojson::value(requests);

  picojson::array accessModes;
  accessModes.push_back(str("ReadWriteOnce"));

  picojson::object claimSpec;
  claimSpec["accessModes"] = picojson::value(accessModes);
  claimSpec["resources"] = picojson::value(resources);

  if (! spec.storage().class_name().empty()) {
    claimSpec["storageClassName"] = str(spec.storage().class_name());
  }

  picojson::object claimMetadata;
  claimMetadata["name"] = str("data");

  picojson::object claim;
  claim["metadata"] = picojson::value(claimMetadata);
  claim["spec"] = picojson::value(claimSpec);

  picojson::array claims;
  claims.push_back(picojson::value(claim));

  picojson::object selector;
  selector["matchLabels"] = picojson::value(selectorLabels(cluster));

  picojson::object stsSpec;
  stsSpec["replicas"] = num(expectedServers(spec));
  stsSpec["serviceName"] = str(headlessServiceName(cluster));
  stsSpec["podManagementPolicy"] = str("Parallel");
  stsSpec["selector"] = picojson::value(selector);
  stsSpec["template"] = picojson::value(podTemplate);
  stsSpec["volumeClaimTemplates"] = picojson::value(claims);

  child.set_spec_json(picojson::value(stsSpec).serialize());

  return child;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief the headless service used for discovery and member addresses
////////////////////////////////////////////////////////////////////////////////

ChildObject DefaultResourceBuilder::buildHeadlessService (
  const ClusterResource& cluster) const {

  ChildObject child;
  child.set_kind(KIND_SERVICE);
  child.set_api_version("v1");
  child.set_name(headlessServiceName(cluster));
  commonMetadata(cluster, "discovery", child);

  picojson::array ports;
  ports.push_back(picojson::value(port("bolt", BoltPort)));
  ports.push_back(picojson::value(port("http", HttpPort)));
  ports.push_back(picojson::value(port("tcp-discovery", DiscoveryPort)));
  ports.push_back(picojson::value(port("tcp-raft", RaftPort)));

  picojson::object spec;
  spec["clusterIP"] = str("None");
  spec["publishNotReadyAddresses"] = picojson::value(true);
  spec["selector"] = picojson::value(selectorLabels(cluster));
  spec["ports"] = picojson::value(ports);

  child.set_spec_json(picojson::value(spec).serialize());

  return child;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief the load balanced client service
////////////////////////////////////////////////////////////////////////////////

ChildObject DefaultResourceBuilder::buildClientService (
  const ClusterResource& cluster) const {

  ChildObject child;
  child.set_kind(KIND_SERVICE);
  child.set_api_version("v1");
  child.set_name(clientServiceName(cluster));
  commonMetadata(cluster, "client", child);

  picojson::array ports;
  ports.push_back(picojson::value(port("bolt", BoltPort)));
  ports.push_back(picojson::value(port("http", HttpPort)));

  picojson::object spec;
  spec["type"] = str("ClusterIP");
  spec["selector"] = picojson::value(selectorLabels(cluster));
  spec["ports"] = picojson::value(ports);

  child.set_spec_json(picojson::value(spec).serialize());

  return child;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief the configuration of the servers
////////////////////////////////////////////////////////////////////////////////

ChildObject DefaultResourceBuilder::buildConfigMap (
  const ClusterResource& cluster) const {

  ChildObject child;
  child.set_kind(KIND_CONFIG_MAP);
  child.set_api_version("v1");
  child.set_name(configMapName(cluster));
  commonMetadata(cluster, "config", child);

  auto& data = *child.mutable_data();
  data["neo4j.conf"] = neo4jConf(cluster);
  data["startup.sh"] = startupScript(cluster);

  return child;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief neo4j.conf, the bootstrap settings depend on the primary count
////////////////////////////////////////////////////////////////////////////////

string DefaultResourceBuilder::neo4jConf (const ClusterResource& cluster) const {
  const ClusterSpec& spec = cluster.spec();
  int32_t primaries = spec.topology().primaries();
  ostringstream conf;

  conf
  << "server.default_listen_address=0.0.0.0\n"
  << "server.bolt.listen_address=0.0.0.0:" << BoltPort << "\n"
  << "server.http.listen_address=0.0.0.0:" << HttpPort << "\n"
  << "server.cluster.listen_address=0.0.0.0:" << DiscoveryPort << "\n"
  << "server.cluster.raft.listen_address=0.0.0.0:" << RaftPort << "\n"
  << "server.routing.listen_address=0.0.0.0:7688\n"
  << "server.directories.data=/data\n"
  << "server.directories.logs=/logs\n"
  << "server.config.strict_validation.enabled=false\n"
  << "\n"
  << "dbms.cluster.discovery.resolver_type=K8S\n"
  << "dbms.kubernetes.label_selector=" << LABEL_CLUSTER << "=" << cluster.name()
  << "," << LABEL_CLUSTERING << "=true\n"
  << "dbms.kubernetes.discovery.service_port_name=tcp-discovery\n";

  if (primaries <= 1) {
    conf
    << "dbms.cluster.minimum_initial_system_primaries_count=1\n"
    << "initial.dbms.default_primaries_count=1\n";
  }
  else {
    conf
    << "dbms.cluster.minimum_initial_system_primaries_count=" << primaries << "\n"
    << "initial.dbms.default_primaries_count=" << primaries << "\n";
  }

  conf
  << "initial.dbms.default_secondaries_count=" << spec.topology().secondaries() << "\n"
  << "initial.dbms.automatically_enable_free_servers=true\n";

  if (spec.tls().mode() == "cluster") {
    conf
    << "\n"
    << "server.https.enabled=true\n"
    << "server.https.listen_address=0.0.0.0:7473\n"
    << "server.directories.certificates=/ssl\n"
    << "server.bolt.tls_level=OPTIONAL\n";

    const char* policies[] = { "bolt", "https", "cluster" };

    for (const char* policy : policies) {
      conf
      << "dbms.ssl.policy." << policy << ".enabled=true\n"
      << "dbms.ssl.policy." << policy << ".base_directory=/ssl\n"
      << "dbms.ssl.policy." << policy << ".private_key=tls.key\n"
      << "dbms.ssl.policy." << policy << ".public_certificate=tls.crt\n"
      << "dbms.ssl.policy." << policy << ".client_auth=NONE\n";
    }
  }

  if (spec.query_monitoring().enabled()) {
    conf
    << "\n"
    << "db.logs.query.enabled=INFO\n"
    << "db.logs.query.threshold=0\n"
    << "db.logs.query.parameter_logging_enabled=true\n";
  }

  return conf.str();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief startup script, advertises the stable member address
////////////////////////////////////////////////////////////////////////////////

string DefaultResourceBuilder::startupScript (
  const ClusterResource& cluster) const {

  ostringstream script;

  script
  << "#!/bin/bash\n"
  << "set -e\n"
  << "\n"
  << "FQDN=\"${HOSTNAME}." << headlessServiceName(cluster) << "."
  << cluster.ns() << ".svc.cluster.local\"\n"
  << "\n"
  << "mkdir -p /var/lib/neo4j/conf\n"
  << "cp /config/neo4j.conf /var/lib/neo4j/conf/neo4j.conf\n"
  << "echo \"server.default_advertised_address=${FQDN}\" >> /var/lib/neo4j/conf/neo4j.conf\n"
  << "echo \"server.cluster.advertised_address=${FQDN}:" << DiscoveryPort
  << "\" >> /var/lib/neo4j/conf/neo4j.conf\n"
  << "echo \"server.cluster.raft.advertised_address=${FQDN}:" << RaftPort
  << "\" >> /var/lib/neo4j/conf/neo4j.conf\n"
  << "\n"
  << "exec /startup/docker-entrypoint.sh neo4j\n";

  return script.str();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
