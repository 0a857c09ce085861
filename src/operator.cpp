////////////////////////////////////////////////////////////////////////////////
/// @brief neo4j cluster operator
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

#include <signal.h>
#include <string.h>
#include <unistd.h>

#include <iostream>
#include <string>

#include "CircuitBreaker.h"
#include "ClusterController.h"
#include "ConvergenceEngine.h"
#include "DiagnosticsCollector.h"
#include "HttpProtocolClient.h"
#include "HttpServer.h"
#include "KubePlatform.h"
#include "MetricsRegistry.h"
#include "Reconciler.h"
#include "ResourceBuilder.h"
#include "SplitBrainDetector.h"
#include "StatusUpdater.h"
#include "TopologyValidator.h"
#include "utils.h"

#include <curl/curl.h>

#include <glog/logging.h>

#include <stout/flags.hpp>
#include <stout/none.hpp>
#include <stout/os.hpp>

using namespace std;
using namespace neo4j;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

static volatile sig_atomic_t STOP_REQUESTED = 0;

static void onSignal (int) {
  STOP_REQUESTED = 1;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief update from env
////////////////////////////////////////////////////////////////////////////////

static void updateFromEnv (const string& name, string& var) {
  Option<string> env = os::getenv(name);

  if (env.isSome()) {
    var = env.get();
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief update from env
////////////////////////////////////////////////////////////////////////////////

static bool updateFromEnv (const string& name, int& var) {
  Option<string> env = os::getenv(name);

  if (env.isSome()) {
    try {
      var = stoi(env.get());
    }
    catch (const logic_error&) {
      cerr << name << ": expecting a number, got '" << env.get() << "'" << endl;
      return false;
    }
  }

  return true;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief prints help
////////////////////////////////////////////////////////////////////////////////

static void usage (const string& argv0, const flags::FlagsBase& flags) {
  cerr << "Usage: " << argv0 << " [...]" << "\n"
       << "\n"
       << "Supported options:" << "\n"
       << flags.usage() << "\n"
       << "Supported environment:" << "\n"
       << "  NEO4J_AUTH           database credentials as 'user/password'\n"
       << "\n"
       << "  NEO4J_OPERATOR_<FLAG>\n"
       << "                       overrides '--<flag>', for example\n"
       << "                       NEO4J_OPERATOR_WORKERS overrides '--workers'\n"
       << "\n";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief neo4j operator
////////////////////////////////////////////////////////////////////////////////

int main (int argc, char** argv) {

  // ...........................................................................
  // command line options
  // ...........................................................................

  flags::FlagsBase flags;

  string apiServer;
  flags.add(&apiServer,
            "api_server",
            "Kubernetes API base URL",
            "https://kubernetes.default.svc");

  string tokenFile;
  flags.add(&tokenFile,
            "token_file",
            "file containing the bearer token",
            "/var/run/secrets/kubernetes.io/serviceaccount/token");

  string caFile;
  flags.add(&caFile,
            "ca_file",
            "CA bundle of the API server",
            "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt");

  string ns;
  flags.add(&ns,
            "namespace",
            "namespace to watch, all namespaces if empty",
            "");

  int workers;
  flags.add(&workers,
            "workers",
            "number of reconcile workers",
            4);

  int pollInterval;
  flags.add(&pollInterval,
            "poll_interval",
            "seconds between two change polls",
            5);

  int resyncInterval;
  flags.add(&resyncInterval,
            "resync_interval",
            "seconds between two full resyncs",
            300);

  int maxServers;
  flags.add(&maxServers,
            "max_servers",
            "maximal number of servers per cluster",
            20);

  int configDebounce;
  flags.add(&configDebounce,
            "config_debounce",
            "seconds a configuration change must be stable before it is applied",
            120);

  int statusRetries;
  flags.add(&statusRetries,
            "status_retries",
            "attempts of a conflicting status write",
            5);

  int queryTimeout;
  flags.add(&queryTimeout,
            "query_timeout",
            "seconds until a database query is abandoned",
            10);

  int splitBrainInterval;
  flags.add(&splitBrainInterval,
            "split_brain_interval",
            "seconds between two split-brain checks of a Ready cluster",
            60);

  int healthInterval;
  flags.add(&healthInterval,
            "health_interval",
            "seconds between two diagnostics refreshes of a Ready cluster",
            30);

  int httpPort;
  flags.add(&httpPort,
            "http_port",
            "port for health and metrics, 0 disables the server",
            8080);

  string neo4jUser;
  flags.add(&neo4jUser,
            "neo4j_user",
            "database user",
            "neo4j");

  string neo4jPassword;
  flags.add(&neo4jPassword,
            "neo4j_password",
            "database password",
            "");

  auto load = flags.load(None(), argc, argv);

  if (load.isError()) {
    cerr << load.error() << endl;
    usage(argv[0], flags);
    exit(EXIT_FAILURE);
  }

  if (flags.help) {
    usage(argv[0], flags);
    exit(EXIT_SUCCESS);
  }

  updateFromEnv("NEO4J_OPERATOR_API_SERVER", apiServer);
  updateFromEnv("NEO4J_OPERATOR_TOKEN_FILE", tokenFile);
  updateFromEnv("NEO4J_OPERATOR_CA_FILE", caFile);
  updateFromEnv("NEO4J_OPERATOR_NAMESPACE", ns);
  updateFromEnv("NEO4J_OPERATOR_NEO4J_USER", neo4jUser);
  updateFromEnv("NEO4J_OPERATOR_NEO4J_PASSWORD", neo4jPassword);

  bool ok = updateFromEnv("NEO4J_OPERATOR_WORKERS", workers)
         && updateFromEnv("NEO4J_OPERATOR_POLL_INTERVAL", pollInterval)
         && updateFromEnv("NEO4J_OPERATOR_RESYNC_INTERVAL", resyncInterval)
         && updateFromEnv("NEO4J_OPERATOR_MAX_SERVERS", maxServers)
         && updateFromEnv("NEO4J_OPERATOR_CONFIG_DEBOUNCE", configDebounce)
         && updateFromEnv("NEO4J_OPERATOR_STATUS_RETRIES", statusRetries)
         && updateFromEnv("NEO4J_OPERATOR_QUERY_TIMEOUT", queryTimeout)
         && updateFromEnv("NEO4J_OPERATOR_SPLIT_BRAIN_INTERVAL", splitBrainInterval)
         && updateFromEnv("NEO4J_OPERATOR_HEALTH_INTERVAL", healthInterval)
         && updateFromEnv("NEO4J_OPERATOR_HTTP_PORT", httpPort);

  if (! ok) {
    usage(argv[0], flags);
    exit(EXIT_FAILURE);
  }

  Option<string> auth = os::getenv("NEO4J_AUTH");

  if (auth.isSome()) {
    string::size_type n = auth.get().find('/');

    if (n == string::npos) {
      cerr << "NEO4J_AUTH: expecting 'user/password'" << endl;
      usage(argv[0], flags);
      exit(EXIT_FAILURE);
    }

    neo4jUser = auth.get().substr(0, n);
    neo4jPassword = auth.get().substr(n + 1);
  }

  if (workers < 1 || pollInterval < 1 || resyncInterval < 1
      || maxServers < 1 || configDebounce < 0 || statusRetries < 1
      || queryTimeout < 1 || splitBrainInterval < 1 || healthInterval < 1
      || httpPort < 0 || httpPort > 65535) {
    cerr << argv[0] << ": counts and intervals must be positive" << endl;
    usage(argv[0], flags);
    exit(EXIT_FAILURE);
  }

  google::InitGoogleLogging(argv[0]);

  LOG(INFO) << "api server: " << apiServer;
  LOG(INFO) << "namespace: " << (ns.empty() ? string("<all>") : ns);
  LOG(INFO) << "workers: " << workers;
  LOG(INFO) << "maximal servers per cluster: " << maxServers;
  LOG(INFO) << "configuration debounce: " << configDebounce << "s";

  curl_global_init(CURL_GLOBAL_ALL);

  // ...........................................................................
  // platform
  // ...........................................................................

  KubePlatform::Options platformOptions;
  platformOptions.apiServer = apiServer;
  platformOptions.caFile = caFile;
  platformOptions.ns = ns;

  Try<string> token = os::read(tokenFile);

  if (token.isError()) {
    LOG(WARNING)
    << "cannot read token file " << tokenFile << ": " << token.error()
    << ", using anonymous access";
  }
  else {
    platformOptions.token = trimRight(token.get());
  }

  KubePlatform platform(platformOptions);

  // ...........................................................................
  // reconciliation
  // ...........................................................................

  MetricsRegistry registry;
  OperatorMetrics metrics(registry);

  chrono::milliseconds timeout = chrono::seconds(queryTimeout);

  Credentials credentials;
  credentials.user = neo4jUser;
  credentials.password = neo4jPassword;

  HttpProtocolClientFactory factory(credentials, timeout);
  CircuitBreakerRegistry breakers;

  TopologyValidator validator(maxServers);
  DefaultResourceBuilder builder;
  ConvergenceEngine engine(platform, chrono::seconds(configDebounce));
  StatusUpdater updater(platform, metrics, statusRetries);
  SplitBrainDetector detector(factory, platform, metrics, timeout);
  DiagnosticsCollector collector(updater, breakers, metrics, timeout);

  Reconciler::Options reconcilerOptions;
  reconcilerOptions.splitBrainInterval = chrono::seconds(splitBrainInterval);
  reconcilerOptions.queryTimeout = timeout;

  Reconciler reconciler(platform, validator, builder, engine, updater,
                        detector, collector, factory, breakers, metrics,
                        reconcilerOptions);

  ClusterController::Options controllerOptions;
  controllerOptions.workers = workers;
  controllerOptions.pollInterval = chrono::seconds(pollInterval);
  controllerOptions.resyncInterval = chrono::seconds(resyncInterval);
  controllerOptions.healthInterval = chrono::seconds(healthInterval);

  ClusterController controller(platform, reconciler, controllerOptions);

  // ...........................................................................
  // http server
  // ...........................................................................

  HttpServer http(controller, registry);

  if (0 < httpPort) {
    Result res = http.start(httpPort);

    if (res.isError()) {
      LOG(ERROR) << res.toString();
      curl_global_cleanup();
      return EXIT_FAILURE;
    }
  }

  // ...........................................................................
  // run until signalled
  // ...........................................................................

  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = onSignal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  controller.start();

  LOG(INFO) << "operator started";

  while (STOP_REQUESTED == 0) {
    usleep(200 * 1000);
  }

  LOG(INFO) << "shutting down";

  controller.stop();
  http.stop();

  curl_global_cleanup();

  return EXIT_SUCCESS;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
