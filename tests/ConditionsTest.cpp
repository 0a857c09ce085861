////////////////////////////////////////////////////////////////////////////////
/// @brief tests for status conditions
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

#include "Conditions.h"

#include <gtest/gtest.h>

using namespace neo4j;
using namespace std;

TEST(Conditions, InsertsNewCondition) {
  ClusterStatus status;

  EXPECT_TRUE(setCondition(status, CONDITION_READY, STATUS_FALSE,
                           REASON_CLUSTER_FORMING, "1 of 3 servers running",
                           4, "2024-01-01T00:00:00Z"));

  const Condition* c = findCondition(status, CONDITION_READY);
  ASSERT_NE(nullptr, c);
  EXPECT_EQ("False", c->status());
  EXPECT_EQ("ClusterForming", c->reason());
  EXPECT_EQ(4, c->observed_generation());
  EXPECT_EQ("2024-01-01T00:00:00Z", c->last_transition_time());
}

TEST(Conditions, KeepsTransitionTimeWhenStatusUnchanged) {
  ClusterStatus status;
  setCondition(status, CONDITION_READY, STATUS_FALSE, REASON_CLUSTER_FORMING,
               "1 of 3 servers running", 1, "2024-01-01T00:00:00Z");

  EXPECT_TRUE(setCondition(status, CONDITION_READY, STATUS_FALSE,
                           REASON_CLUSTER_FORMING, "2 of 3 servers running",
                           1, "2024-01-01T00:05:00Z"));

  const Condition* c = findCondition(status, CONDITION_READY);
  ASSERT_NE(nullptr, c);
  EXPECT_EQ("2 of 3 servers running", c->message());
  EXPECT_EQ("2024-01-01T00:00:00Z", c->last_transition_time());
  EXPECT_EQ(1, status.conditions_size());

  EXPECT_FALSE(setCondition(status, CONDITION_READY, STATUS_FALSE,
                            REASON_CLUSTER_FORMING, "2 of 3 servers running",
                            1, "2024-01-01T00:06:00Z"));
}

TEST(Conditions, StampsTransition) {
  ClusterStatus status;
  setCondition(status, CONDITION_READY, STATUS_FALSE, REASON_CLUSTER_FORMING,
               "", 1, "2024-01-01T00:00:00Z");
  setCondition(status, CONDITION_READY, STATUS_TRUE, REASON_CLUSTER_READY,
               "Cluster is ready", 1, "2024-01-01T00:10:00Z");

  const Condition* c = findCondition(status, CONDITION_READY);
  ASSERT_NE(nullptr, c);
  EXPECT_EQ("True", c->status());
  EXPECT_EQ("2024-01-01T00:10:00Z", c->last_transition_time());
}

TEST(Conditions, StampsReasonChangeWithSameStatus) {
  ClusterStatus status;
  setCondition(status, CONDITION_READY, STATUS_FALSE, REASON_CLUSTER_FORMING,
               "1 of 3 servers running", 1, "2024-01-01T00:00:00Z");

  EXPECT_TRUE(setCondition(status, CONDITION_READY, STATUS_FALSE,
                           REASON_RECONCILIATION_FAILED, "api server down",
                           1, "2024-01-01T00:02:00Z"));

  const Condition* c = findCondition(status, CONDITION_READY);
  ASSERT_NE(nullptr, c);
  EXPECT_EQ("False", c->status());
  EXPECT_EQ("ReconciliationFailed", c->reason());
  EXPECT_EQ("2024-01-01T00:02:00Z", c->last_transition_time());
  EXPECT_EQ(1, status.conditions_size());
}

TEST(Conditions, ConditionsAreIndependent) {
  ClusterStatus status;
  setCondition(status, CONDITION_READY, STATUS_TRUE, REASON_CLUSTER_READY,
               "", 1, "t1");
  setCondition(status, CONDITION_SERVERS_HEALTHY, STATUS_FALSE,
               REASON_SERVER_DEGRADED, "server-2 Unavailable", 1, "t1");

  EXPECT_EQ(2, status.conditions_size());
  EXPECT_EQ(nullptr, findCondition(status, CONDITION_DATABASES_HEALTHY));

  EXPECT_TRUE(removeCondition(status, CONDITION_READY));
  EXPECT_FALSE(removeCondition(status, CONDITION_READY));
  EXPECT_EQ(1, status.conditions_size());
  EXPECT_NE(nullptr, findCondition(status, CONDITION_SERVERS_HEALTHY));
}

TEST(Conditions, PhaseToReadyStatus) {
  EXPECT_EQ("True", phaseToConditionStatus(PHASE_READY));
  EXPECT_EQ("False", phaseToConditionStatus(PHASE_FAILED));
  EXPECT_EQ("False", phaseToConditionStatus(PHASE_DEGRADED));
  EXPECT_EQ("Unknown", phaseToConditionStatus(PHASE_PENDING));
  EXPECT_EQ("Unknown", phaseToConditionStatus(PHASE_FORMING));
  EXPECT_EQ("Unknown", phaseToConditionStatus("Whatever"));
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
