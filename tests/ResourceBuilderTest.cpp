////////////////////////////////////////////////////////////////////////////////
/// @brief tests for the desired child objects
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

#include <gtest/gtest.h>

#include <picojson.h>

using namespace neo4j;
using namespace std;

namespace {
  ClusterResource cluster (int primaries, int secondaries) {
    ClusterResource c;
    c.set_name("graph");
    c.set_ns("prod");
    c.mutable_spec()->mutable_topology()->set_primaries(primaries);
    c.mutable_spec()->mutable_topology()->set_secondaries(secondaries);
    c.mutable_spec()->mutable_image()->set_repo("neo4j");
    c.mutable_spec()->mutable_image()->set_tag("5.26-enterprise");
    return c;
  }

  picojson::value parse (const string& json) {
    picojson::value v;
    string err = picojson::parse(v, json);
    EXPECT_EQ("", err);
    return v;
  }
}

TEST(ResourceBuilder, Naming) {
  ClusterResource c = cluster(3, 0);

  EXPECT_EQ("graph-server", statefulSetName(c));
  EXPECT_EQ("graph-headless", headlessServiceName(c));
  EXPECT_EQ("graph-client", clientServiceName(c));
  EXPECT_EQ("graph-config", configMapName(c));
  EXPECT_EQ("graph-client.prod.svc.cluster.local", clientServiceHost(c));
  EXPECT_EQ("graph-server-1.graph-headless.prod.svc.cluster.local",
            memberHost(c, "graph-server-1"));
  EXPECT_EQ("neo4j:5.26-enterprise", imageReference(c.spec()));
  EXPECT_EQ(3, expectedServers(c.spec()));
}

TEST(ResourceBuilder, DesiredStateOrder) {
  DefaultResourceBuilder builder;
  vector<ChildObject> children = builder.desiredState(cluster(3, 2));

  ASSERT_EQ(4u, children.size());
  EXPECT_EQ(KIND_CONFIG_MAP, children[0].kind());
  EXPECT_EQ("graph-headless", children[1].name());
  EXPECT_EQ("graph-client", children[2].name());
  EXPECT_EQ(KIND_STATEFUL_SET, children[3].kind());

  for (const auto& child : children) {
    EXPECT_EQ("prod", child.ns());
    EXPECT_EQ("graph", child.labels().at(LABEL_INSTANCE));
    EXPECT_EQ(MANAGED_BY_VALUE, child.labels().at(LABEL_MANAGED_BY));
  }
}

TEST(ResourceBuilder, IsDeterministic) {
  DefaultResourceBuilder builder;
  ClusterResource c = cluster(3, 1);

  vector<ChildObject> a = builder.desiredState(c);
  vector<ChildObject> b = builder.desiredState(c);

  ASSERT_EQ(a.size(), b.size());

  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].SerializeAsString(), b[i].SerializeAsString());
  }
}

TEST(ResourceBuilder, StatefulSet) {
  DefaultResourceBuilder builder;
  ChildObject sts = builder.buildStatefulSet(cluster(3, 2));

  EXPECT_EQ("apps/v1", sts.api_version());
  EXPECT_EQ("3", sts.annotations().at(ANNOTATION_PRIMARIES));
  EXPECT_EQ("neo4j:5.26-enterprise", sts.annotations().at(ANNOTATION_IMAGE));

  picojson::value spec = parse(sts.spec_json());
  ASSERT_TRUE(spec.is<picojson::object>());
  EXPECT_EQ(5, spec.get("replicas").get<double>());
  EXPECT_EQ("graph-headless", spec.get("serviceName").get<string>());

  const picojson::value& labels
    = spec.get("template").get("metadata").get("labels");
  EXPECT_EQ("graph", labels.get(LABEL_CLUSTER).get<string>());
  EXPECT_EQ("true", labels.get(LABEL_CLUSTERING).get<string>());

  const picojson::value& container
    = spec.get("template").get("spec").get("containers").get(0);
  EXPECT_EQ("neo4j:5.26-enterprise", container.get("image").get<string>());
}

TEST(ResourceBuilder, StorageClassOnlyWhenGiven) {
  DefaultResourceBuilder builder;
  ClusterResource c = cluster(1, 0);

  EXPECT_EQ(string::npos,
            builder.buildStatefulSet(c).spec_json().find("storageClassName"));

  c.mutable_spec()->mutable_storage()->set_class_name("fast-ssd");
  EXPECT_NE(string::npos,
            builder.buildStatefulSet(c).spec_json().find("\"storageClassName\":\"fast-ssd\""));
}

TEST(ResourceBuilder, HeadlessServicePublishesNotReadyAddresses) {
  DefaultResourceBuilder builder;
  picojson::value spec = parse(builder.buildHeadlessService(cluster(3, 0)).spec_json());

  EXPECT_EQ("None", spec.get("clusterIP").get<string>());
  EXPECT_TRUE(spec.get("publishNotReadyAddresses").get<bool>());
  EXPECT_EQ(4u, spec.get("ports").get<picojson::array>().size());
}

TEST(ResourceBuilder, ConfigDependsOnPrimaries) {
  DefaultResourceBuilder builder;

  string single = builder.buildConfigMap(cluster(1, 0)).data().at("neo4j.conf");
  EXPECT_NE(string::npos,
            single.find("dbms.cluster.minimum_initial_system_primaries_count=1\n"));

  string multi = builder.buildConfigMap(cluster(3, 2)).data().at("neo4j.conf");
  EXPECT_NE(string::npos,
            multi.find("dbms.cluster.minimum_initial_system_primaries_count=3\n"));
  EXPECT_NE(string::npos, multi.find("initial.dbms.default_secondaries_count=2\n"));
  EXPECT_NE(string::npos,
            multi.find("dbms.kubernetes.label_selector=neo4j.com/cluster=graph,"
                       "neo4j.com/clustering=true\n"));
}

TEST(ResourceBuilder, OptionalSettings) {
  DefaultResourceBuilder builder;
  ClusterResource c = cluster(3, 0);

  string plain = builder.buildConfigMap(c).data().at("neo4j.conf");
  EXPECT_EQ(string::npos, plain.find("dbms.ssl.policy"));
  EXPECT_EQ(string::npos, plain.find("db.logs.query.enabled"));

  c.mutable_spec()->mutable_tls()->set_mode("cluster");
  c.mutable_spec()->mutable_query_monitoring()->set_enabled(true);

  string full = builder.buildConfigMap(c).data().at("neo4j.conf");
  EXPECT_NE(string::npos, full.find("dbms.ssl.policy.cluster.enabled=true\n"));
  EXPECT_NE(string::npos, full.find("db.logs.query.enabled=INFO\n"));
}

TEST(ResourceBuilder, StartupScriptAdvertisesMemberAddress) {
  DefaultResourceBuilder builder;
  string script = builder.buildConfigMap(cluster(3, 0)).data().at("startup.sh");

  EXPECT_NE(string::npos,
            script.find("FQDN=\"${HOSTNAME}.graph-headless.prod.svc.cluster.local\""));
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
