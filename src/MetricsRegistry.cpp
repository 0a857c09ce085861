////////////////////////////////////////////////////////////////////////////////
/// @brief metrics registry
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

#include "MetricsRegistry.h"

#include <sstream>

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief escapes a label value
////////////////////////////////////////////////////////////////////////////////

static string escapeLabel (const string& value) {
  string result;
  result.reserve(value.size());

  for (char c : value) {
    switch (c) {
      case '\\': result += "\\\\"; break;
      case '"':  result += "\\\""; break;
      case '\n': result += "\\n"; break;
      default:   result += c; break;
    }
  }

  return result;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                class MetricFamily
// -----------------------------------------------------------------------------

MetricFamily::MetricFamily (const string& name,
                            const string& help,
                            const string& type,
                            const vector<string>& labelNames)
  : _name(name),
    _help(help),
    _type(type),
    _labelNames(labelNames) {
}

MetricFamily::~MetricFamily () {
}

double MetricFamily::value (const vector<string>& labelValues) const {
  lock_guard<mutex> lock(_lock);

  auto iter = _samples.find(labelValues);
  return iter == _samples.end() ? 0.0 : iter->second;
}

size_t MetricFamily::size () const {
  lock_guard<mutex> lock(_lock);
  return _samples.size();
}

void MetricFamily::remove (const vector<string>& labelValues) {
  lock_guard<mutex> lock(_lock);
  _samples.erase(labelValues);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief appends the Prometheus text exposition of the family
////////////////////////////////////////////////////////////////////////////////

void MetricFamily::serialize (string& out) const {
  lock_guard<mutex> lock(_lock);
  ostringstream s;

  s << "# HELP " << _name << " " << _help << "\n";
  s << "# TYPE " << _name << " " << _type << "\n";

  for (const auto& sample : _samples) {
    s << _name;

    if (! _labelNames.empty()) {
      s << "{";

      for (size_t i = 0; i < _labelNames.size(); ++i) {
        if (i > 0) {
          s << ",";
        }

        s << _labelNames[i] << "=\"" << escapeLabel(sample.first[i]) << "\"";
      }

      s << "}";
    }

    s << " " << sample.second << "\n";
  }

  out += s.str();
}

bool MetricFamily::checkLabels (const vector<string>& labelValues) const {
  if (labelValues.size() != _labelNames.size()) {
    LOG(WARNING)
    << "metric " << _name << " expects " << _labelNames.size()
    << " label values, got " << labelValues.size();
    return false;
  }

  return true;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                 class Gauge
// -----------------------------------------------------------------------------

void Gauge::set (const vector<string>& labelValues, double value) {
  if (! checkLabels(labelValues)) {
    return;
  }

  lock_guard<mutex> lock(_lock);
  _samples[labelValues] = value;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                 class Counter
// -----------------------------------------------------------------------------

void Counter::inc (const vector<string>& labelValues, double by) {
  if (! checkLabels(labelValues)) {
    return;
  }

  if (by < 0) {
    LOG(WARNING)
    << "counter " << _name << " cannot be decremented";
    return;
  }

  lock_guard<mutex> lock(_lock);
  _samples[labelValues] += by;
}

// -----------------------------------------------------------------------------
// --SECTION--                                             class MetricsRegistry
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

MetricsRegistry::MetricsRegistry () {
}

MetricsRegistry::~MetricsRegistry () {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief registers a gauge or returns the existing one
////////////////////////////////////////////////////////////////////////////////

Gauge* MetricsRegistry::registerGauge (const string& name,
                                       const string& help,
                                       const vector<string>& labelNames) {
  lock_guard<mutex> lock(_lock);

  auto& gauge = _gauges[name];

  if (gauge == nullptr) {
    gauge.reset(new Gauge(name, help, labelNames));
  }

  return gauge.get();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief registers a counter or returns the existing one
////////////////////////////////////////////////////////////////////////////////

Counter* MetricsRegistry::registerCounter (const string& name,
                                           const string& help,
                                           const vector<string>& labelNames) {
  lock_guard<mutex> lock(_lock);

  auto& counter = _counters[name];

  if (counter == nullptr) {
    counter.reset(new Counter(name, help, labelNames));
  }

  return counter.get();
}

size_t MetricsRegistry::size () const {
  lock_guard<mutex> lock(_lock);
  return _gauges.size() + _counters.size();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief Prometheus text exposition of all families
////////////////////////////////////////////////////////////////////////////////

string MetricsRegistry::serialize () const {
  lock_guard<mutex> lock(_lock);
  string result;

  for (const auto& gauge : _gauges) {
    gauge.second->serialize(result);
  }

  for (const auto& counter : _counters) {
    counter.second->serialize(result);
  }

  return result;
}

// -----------------------------------------------------------------------------
// --SECTION--                                              struct OperatorMetrics
// -----------------------------------------------------------------------------

OperatorMetrics::OperatorMetrics (MetricsRegistry& registry)
  : serverHealth(registry.registerGauge(
      "neo4j_operator_server_health",
      "Health of a Neo4j server, 1 if Enabled and Available, 0 otherwise",
      {"cluster_name", "namespace", "server_name", "server_address"})),
    splitBrainDetected(registry.registerCounter(
      "neo4j_operator_split_brain_detected_total",
      "Number of detected split-brain situations",
      {"cluster_name", "namespace"})),
    reconcileTotal(registry.registerCounter(
      "neo4j_operator_reconcile_total",
      "Number of reconcile passes",
      {"cluster_name", "namespace", "result"})),
    resourceVersionConflicts(registry.registerCounter(
      "neo4j_operator_resource_version_conflicts_total",
      "Number of optimistic concurrency conflicts on status writes",
      {"cluster_name", "namespace"})) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
