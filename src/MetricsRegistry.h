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

#ifndef NEO4J_METRICS_REGISTRY_H
#define NEO4J_METRICS_REGISTRY_H 1

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace neo4j {

// -----------------------------------------------------------------------------
// --SECTION--                                               class MetricFamily
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief a named metric with a fixed list of label names and one sample per
/// distinct list of label values
////////////////////////////////////////////////////////////////////////////////

  class MetricFamily {
    MetricFamily (const MetricFamily&) = delete;
    MetricFamily& operator= (const MetricFamily&) = delete;

    public:

      MetricFamily (const std::string& name,
                    const std::string& help,
                    const std::string& type,
                    const std::vector<std::string>& labelNames);

      virtual ~MetricFamily ();

    public:

      const std::string& name () const {
        return _name;
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief current value of a sample, 0 if it does not exist
////////////////////////////////////////////////////////////////////////////////

      double value (const std::vector<std::string>& labelValues) const;

////////////////////////////////////////////////////////////////////////////////
/// @brief number of samples
////////////////////////////////////////////////////////////////////////////////

      size_t size () const;

////////////////////////////////////////////////////////////////////////////////
/// @brief drops a sample
////////////////////////////////////////////////////////////////////////////////

      void remove (const std::vector<std::string>& labelValues);

////////////////////////////////////////////////////////////////////////////////
/// @brief appends the Prometheus text exposition of the family
////////////////////////////////////////////////////////////////////////////////

      void serialize (std::string& out) const;

    protected:

      bool checkLabels (const std::vector<std::string>&) const;

    protected:

      const std::string _name;
      const std::string _help;
      const std::string _type;
      const std::vector<std::string> _labelNames;

      mutable std::mutex _lock;
      std::map<std::vector<std::string>, double> _samples;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                                      class Gauge
// -----------------------------------------------------------------------------

  class Gauge : public MetricFamily {
    public:

      Gauge (const std::string& name,
             const std::string& help,
             const std::vector<std::string>& labelNames)
        : MetricFamily(name, help, "gauge", labelNames) {
      }

    public:

      void set (const std::vector<std::string>& labelValues, double value);
  };

// -----------------------------------------------------------------------------
// --SECTION--                                                    class Counter
// -----------------------------------------------------------------------------

  class Counter : public MetricFamily {
    public:

      Counter (const std::string& name,
               const std::string& help,
               const std::vector<std::string>& labelNames)
        : MetricFamily(name, help, "counter", labelNames) {
      }

    public:

      void inc (const std::vector<std::string>& labelValues, double by = 1.0);
  };

// -----------------------------------------------------------------------------
// --SECTION--                                            class MetricsRegistry
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief process wide registry of metric families
///
/// The registry is created once in main and handed to the components that
/// emit metrics. Registration is register-if-absent: registering a name a
/// second time returns the family created first.
////////////////////////////////////////////////////////////////////////////////

  class MetricsRegistry {
    MetricsRegistry (const MetricsRegistry&) = delete;
    MetricsRegistry& operator= (const MetricsRegistry&) = delete;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      MetricsRegistry ();

      ~MetricsRegistry ();

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief registers a gauge or returns the existing one
////////////////////////////////////////////////////////////////////////////////

      Gauge* registerGauge (const std::string& name,
                            const std::string& help,
                            const std::vector<std::string>& labelNames);

////////////////////////////////////////////////////////////////////////////////
/// @brief registers a counter or returns the existing one
////////////////////////////////////////////////////////////////////////////////

      Counter* registerCounter (const std::string& name,
                                const std::string& help,
                                const std::vector<std::string>& labelNames);

////////////////////////////////////////////////////////////////////////////////
/// @brief number of registered families
////////////////////////////////////////////////////////////////////////////////

      size_t size () const;

////////////////////////////////////////////////////////////////////////////////
/// @brief Prometheus text exposition of all families
////////////////////////////////////////////////////////////////////////////////

      std::string serialize () const;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      mutable std::mutex _lock;

      std::map<std::string, std::unique_ptr<Gauge>> _gauges;

      std::map<std::string, std::unique_ptr<Counter>> _counters;
  };

// -----------------------------------------------------------------------------
// --SECTION--                                                 operator metrics
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief the metric families of the operator
////////////////////////////////////////////////////////////////////////////////

  struct OperatorMetrics {
    explicit OperatorMetrics (MetricsRegistry&);

    Gauge* serverHealth;
    Counter* splitBrainDetected;
    Counter* reconcileTotal;
    Counter* resourceVersionConflicts;
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
